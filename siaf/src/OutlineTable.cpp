#include "PlotSurface.h"
#include "StringStuff.h"

using namespace siaf;

void
OutlineTable::drawPolygon(const linalg::DVector& x, const linalg::DVector& y,
			  const string& name) {
  if (x.size()!=y.size())
    FormatAndThrow<std::invalid_argument>() << "Outline " << name
					    << " has unequal x and y lengths";
  Polygon p;
  p.name = name;
  for (int i=0; i<x.size(); i++) {
    p.x.push_back(x[i]);
    p.y.push_back(y[i]);
  }
  polygons.push_back(p);
}

void
OutlineTable::drawLabel(double x, double y, const string& text) {
  Label l;
  l.x = x;
  l.y = y;
  l.text = text;
  labels.push_back(l);
}

void
OutlineTable::write(std::ostream& os) const {
  stringstuff::StreamSaver ss(os);
  if (!title.empty()) os << "# title: " << title << endl;
  if (!xlabel.empty()) os << "# xlabel: " << xlabel << endl;
  if (!ylabel.empty()) os << "# ylabel: " << ylabel << endl;
  if (flipped) os << "# xaxis: reversed" << endl;
  os << std::fixed << std::setprecision(4);
  for (auto& l : labels)
    os << "# label " << l.x << " " << l.y << " " << l.text << endl;
  bool first = true;
  for (auto& p : polygons) {
    if (!first) os << endl;
    first = false;
    for (int i=0; i<p.x.size(); i++)
      os << setw(12) << p.x[i] << " " << setw(12) << p.y[i] << " " << p.name << endl;
  }
}
