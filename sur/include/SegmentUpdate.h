// One commanded rigid-body move of one primary-mirror segment, as found
// in an UPDATE element of a Segment Update Request:
//
//   <UPDATE id="3" type="pose" seg_id="A1-1" absolute="false" coord="local" stage_type="fine_only">
//       <PISTON  units="meters">1.000000E-06</PISTON>
//   </UPDATE>
//
// Only "pose" updates are supported.  Moves are keyed by axis name,
// one of PISTON, X_TRANS, Y_TRANS, X_TILT, Y_TILT, CLOCK, each with its
// units string.
#ifndef SEGMENTUPDATE_H
#define SEGMENTUPDATE_H

#include <map>
#include <stdexcept>
#include "Std.h"
#include "XmlTree.h"

namespace sur {

  class SurError: public std::runtime_error {
  public:
    SurError(const string &m=""): std::runtime_error("SUR Error: " +m) {}
  };

  class UnsupportedSchema: public SurError {
  public:
    UnsupportedSchema(const string &m=""): SurError("Unsupported schema: " +m) {}
  };

  class UnsupportedUpdateType: public SurError {
  public:
    UnsupportedUpdateType(const string &m=""): SurError("Unsupported update type: " +m) {}
  };

  // Conversions between segment-local and global coordinates are not implemented
  class NotSupported: public SurError {
  public:
    NotSupported(const string &m=""): SurError("Not supported: " +m) {}
  };

  typedef std::map<string,double> Moves;
  typedef std::map<string,string> MoveUnits;

  // Axis names in the order they are written to XML
  const vector<string>& axisNames();

  // Value of a required attribute; UnsupportedSchema if absent
  string requireAttribute(const xmltree::Element& node, const string& name);

  class SegmentUpdate {
  public:
    explicit SegmentUpdate(const xmltree::Element& node);

    int getId() const {return id;}
    const string& getType() const {return type;}
    // Two-character segment name, e.g. "A1"
    const string& getSegment() const {return segment;}
    bool isAbsolute() const {return absolute;}
    const string& getCoord() const {return coord;}
    const string& getStageType() const {return stageType;}
    const Moves& getMoves() const {return moves;}
    const MoveUnits& getUnits() const {return units;}

    // The moves, if they are already in the requested coordinates;
    // otherwise NotSupported.
    const Moves& toGlobal() const;
    const Moves& toLocal() const;

    // Update <id>, <absolute|relative>, <coord>: {AXIS: value, ...}
    string str() const;
    // Update <id>: <seg>, <absolute|relative>, <coord> {PISTON=..., ...}
    string shortstr() const;
    // The UPDATE element, indented for a SUR document, ending in a newline
    string xmltext() const;

  private:
    int id;
    string type;
    string segment;
    bool absolute;
    string coord;
    string stageType;
    Moves moves;
    MoveUnits units;
  };

  std::ostream& operator<<(std::ostream& os, const SegmentUpdate& u);

} // namespace sur

#endif // SEGMENTUPDATE_H
