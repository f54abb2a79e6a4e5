// Test reading, summarizing and regenerating Segment Update Requests.
// usage: testSur <directory holding sur_example.xml> [regenerated copy of it]
#include <cmath>
#include "Sur.h"
#include "XmlTree.h"
#include "Checks.h"

using namespace checks;
using namespace sur;

namespace {
  std::unique_ptr<xmltree::Document> updateDoc(const string& attributes, const string& body) {
    return xmltree::Document::parse("<UPDATE " + attributes + ">" + body + "</UPDATE>",
				    "update");
  }
  const string poseAttributes =
    "id=\"7\" type=\"pose\" seg_id=\"A3-9\" absolute=\"true\" coord=\"global\" stage_type=\"none\"";

  bool sameUpdates(const Sur& a, const Sur& b) {
    if (a.nGroups() != b.nGroups()) return false;
    for (int i=0; i<a.nGroups(); i++) {
      const Group& ga = a.getGroups()[i];
      const Group& gb = b.getGroups()[i];
      if (ga.size() != gb.size()) return false;
      for (int j=0; j<ga.size(); j++) {
	if (ga[j].getId() != gb[j].getId()
	    || ga[j].getSegment() != gb[j].getSegment()
	    || ga[j].isAbsolute() != gb[j].isAbsolute()
	    || ga[j].getCoord() != gb[j].getCoord()
	    || ga[j].getStageType() != gb[j].getStageType()
	    || ga[j].getMoves() != gb[j].getMoves()
	    || ga[j].getUnits() != gb[j].getUnits())
	  return false;
      }
    }
    return true;
  }
}

int
main(int argc, char *argv[])
{
  if (argc < 2 || argc > 3) {
    cerr << "usage: testSur <SUR fixture directory> [regenerated SUR file]" << endl;
    exit(1);
  }
  string filename = string(argv[1]) + "/sur_example.xml";

  Sur sur(filename);
  check(sur.getFilename()==filename, "filename");
  check(sur.getCreator()=="wss" && sur.getDate()=="2016-05-12"
	&& sur.getTime()=="14:03:55" && sur.getVersion()=="1.1.2"
	&& sur.getOperational()=="false", "root attributes");
  check(sur.getConfigurationName()=="PM_MOVE_TEST", "configuration name");
  check(sur.getCorrectionId()=="R2016051201", "correction id");
  check(sur.nGroups()==2 && sur.nUpdates()==3, "group and update counts");

  const SegmentUpdate& u1 = sur.getGroups()[0][0];
  check(u1.getId()==1 && u1.getSegment()=="A1" && !u1.isAbsolute()
	&& u1.getCoord()=="local" && u1.getStageType()=="recenter_fine", "update attributes");
  check(u1.getMoves().size()==6 && u1.getUnits().size()==6, "all six axes");
  checkClose(u1.getMoves().at("Y_TRANS"), -2.5e-6, 1e-20, "move value");
  check(u1.getUnits().at("CLOCK")=="radians", "move units");

  // Frame accessors only pass through moves already in that frame
  check(&u1.toLocal()==&u1.getMoves(), "toLocal on local update");
  checkThrows<NotSupported>([&]() {u1.toGlobal();}, "local to global not implemented");
  const SegmentUpdate& u2 = sur.getGroups()[0][1];
  check(u2.toGlobal().size()==1, "toGlobal on global update");
  checkThrows<NotSupported>([&]() {u2.toLocal();}, "global to local not implemented");

  // Summaries
  check(u2.str()=="Update 2, absolute, global: {PISTON: 5e-08}", "str");
  check(u2.shortstr()=="Update 2: B2, absolute, global {PISTON=5e-08, X_TRANS=nan, "
	"Y_TRANS=nan, CLOCK=nan, X_TILT=nan, Y_TILT=nan}", "shortstr");
  check(sur.str().find("SUR " + filename + "\n\tGroup 1\n\t\tUpdate 1, relative, local: {")==0,
	"document summary");

  // XML text layout
  const SegmentUpdate& u3 = sur.getGroups()[1][0];
  check(u3.xmltext() ==
	"        <UPDATE id=\"3\" type=\"pose\" seg_id=\"C3\" absolute=\"false\" coord=\"local\" stage_type=\"none\">\n"
	"            <X_TILT  units=\"radians\">-1.000000E-07</X_TILT>\n"
	"            <CLOCK  units=\"radians\">2.000000E-07</CLOCK>\n"
	"        </UPDATE>\n", "update XML in axis order");
  string text = sur.xmltext();
  check(text.find("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n"
		  "<SEGMENT_UPDATE_REQUEST creator=\"wss\" date=\"2016-05-12\" time=\"14:03:55\""
		  " version=\"1.1.2\" operational=\"false\"")==0, "document header");
  check(text.find("    <GROUP id=\"2\">\n")!=string::npos, "group numbering");
  check(text.size()>0 && text[text.size()-1]=='>', "no trailing newline");

  // Regenerating from generated text is stable
  std::unique_ptr<Sur> again = Sur::parse(text, "regenerated");
  check(sameUpdates(sur, *again), "same groups, updates and moves");
  check(again->xmltext()==text, "identical regenerated text");
  check(again->getCreator()=="wss", "metadata carried through");

  // Construction errors
  checkThrows<UnsupportedUpdateType>([&]() {
      auto doc = updateDoc("id=\"1\" type=\"translate\" seg_id=\"A1\" absolute=\"true\""
			   " coord=\"global\" stage_type=\"none\"", "");
      SegmentUpdate u(doc->root());
    }, "only pose updates");
  checkThrows<UnsupportedSchema>([&]() {
      auto doc = updateDoc(poseAttributes, "<TWIST units=\"radians\">1</TWIST>");
      SegmentUpdate u(doc->root());
    }, "unknown axis");
  checkThrows<UnsupportedSchema>([&]() {
      auto doc = updateDoc(poseAttributes, "<PISTON units=\"meters\">far</PISTON>");
      SegmentUpdate u(doc->root());
    }, "non-numeric move");
  checkThrows<UnsupportedSchema>([&]() {
      auto doc = updateDoc(poseAttributes, "<PISTON>1e-6</PISTON>");
      SegmentUpdate u(doc->root());
    }, "move without units");
  checkThrows<UnsupportedSchema>([&]() {
      auto doc = updateDoc("type=\"pose\"", "");
      SegmentUpdate u(doc->root());
    }, "missing attributes");
  checkThrows<UnsupportedSchema>([&]() {Sur::parse("<OTHER/>", "other");}, "wrong root");

  // Escaping of metadata
  {
    std::unique_ptr<Sur> s = Sur::parse(
      "<SEGMENT_UPDATE_REQUEST creator=\"a&amp;b\" date=\"d\" time=\"t\" version=\"v\" operational=\"true\">"
      "<CONFIGURATION_NAME>x&lt;y</CONFIGURATION_NAME></SEGMENT_UPDATE_REQUEST>", "escaped");
    check(s->getCreator()=="a&b" && s->getConfigurationName()=="x<y", "unescaped on read");
    string t = s->xmltext();
    check(t.find("creator=\"a&amp;b\"")!=string::npos
	  && t.find("<CONFIGURATION_NAME>x&lt;y</CONFIGURATION_NAME>")!=string::npos,
	  "escaped on write");
    check(s->nGroups()==0 && s->getCorrectionId().empty(), "no groups, empty id");
  }

  // A file written by RewriteSur reads back to the same request
  if (argc > 2) {
    Sur rewritten(argv[2]);
    check(sameUpdates(sur, rewritten), "rewritten file has same updates");
    check(rewritten.xmltext()==text, "rewritten file regenerates identically");
  }

  return summary("testSur");
}
