// Drawing context for aperture outlines.  Apertures hand their outlines
// to whatever surface the caller supplies; nothing is drawn to any
// global "current" plot.
#ifndef PLOTSURFACE_H
#define PLOTSURFACE_H

#include <list>
#include "Std.h"
#include "LinearAlgebra.h"

namespace siaf {

  class PlotSurface {
  public:
    virtual ~PlotSurface() {}
    // A polyline through the points; callers close outlines themselves
    virtual void drawPolygon(const linalg::DVector& x, const linalg::DVector& y,
			     const string& name) =0;
    virtual void drawLabel(double x, double y, const string& text) =0;
    virtual void setAxisLabels(const string& xlabel, const string& ylabel) =0;
    virtual void setTitle(const string& title) =0;
    // Make x increase to the left
    virtual void flipXAxis() =0;
  };

  // A PlotSurface that saves everything and writes it as an ASCII table:
  //   # title: <title>
  //   # xlabel: <xlabel>
  //   # ylabel: <ylabel>
  //   # xaxis: reversed                (if flipped)
  //   # label <x> <y> <text>           (one per label)
  //   <x> <y> <name>                   (one per vertex, blank line between outlines)
  // which gnuplot reads as separate data blocks.
  class OutlineTable: public PlotSurface {
  public:
    OutlineTable(): flipped(false) {}
    virtual void drawPolygon(const linalg::DVector& x, const linalg::DVector& y,
			     const string& name);
    virtual void drawLabel(double x, double y, const string& text);
    virtual void setAxisLabels(const string& xlabel_, const string& ylabel_) {
      xlabel = xlabel_;
      ylabel = ylabel_;
    }
    virtual void setTitle(const string& title_) {title = title_;}
    virtual void flipXAxis() {flipped = true;}

    int nPolygons() const {return polygons.size();}
    int nLabels() const {return labels.size();}
    bool isFlipped() const {return flipped;}
    const string& getTitle() const {return title;}
    const string& getXLabel() const {return xlabel;}
    const string& getYLabel() const {return ylabel;}

    void write(std::ostream& os) const;
  private:
    struct Polygon {
      string name;
      vector<double> x;
      vector<double> y;
    };
    struct Label {
      double x;
      double y;
      string text;
    };
    std::list<Polygon> polygons;
    std::list<Label> labels;
    string title;
    string xlabel;
    string ylabel;
    bool flipped;
  };

} // namespace siaf

#endif // PLOTSURFACE_H
