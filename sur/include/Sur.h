// Segment Update Request document: metadata plus an ordered list of
// groups, each an ordered list of SegmentUpdates.  Group order is the
// order in which commands are applied.
//
// xmltext() regenerates the document in the layout the mirror control
// software reads; parsing that text again gives the same groups.
#ifndef SUR_H
#define SUR_H

#include <memory>
#include "Std.h"
#include "SegmentUpdate.h"

namespace sur {

  typedef vector<SegmentUpdate> Group;

  class Sur {
  public:
    // Read a SUR file; throws XmlError or SurError
    explicit Sur(const string& filename);
    // Parse SUR text held in memory; name stands in for the filename
    static std::unique_ptr<Sur> parse(const string& text,
				      const string& name="<string>");

    const string& getFilename() const {return filename;}
    const string& getCreator() const {return creator;}
    const string& getDate() const {return date;}
    const string& getTime() const {return time;}
    const string& getVersion() const {return version;}
    const string& getOperational() const {return operational;}
    const string& getConfigurationName() const {return configurationName;}
    const string& getCorrectionId() const {return correctionId;}

    const vector<Group>& getGroups() const {return groups;}
    int nGroups() const {return groups.size();}
    int nUpdates() const;

    // SUR <filename>, then one tab-indented line per group and update
    string str() const;
    // The whole document as XML, without a trailing newline
    string xmltext() const;

  private:
    Sur() {}
    void load(const xmltree::Element& root);
    string filename;
    string creator;
    string date;
    string time;
    string version;
    string operational;
    string configurationName;
    string correctionId;
    vector<Group> groups;
  };

} // namespace sur

#endif // SUR_H
