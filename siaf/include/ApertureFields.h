// Field table read from one SiafEntry element of a SIAF XML file.
//
// Each child element of the entry becomes one named field:
//  * an element with no element children is a scalar: a number when its
//    whole text parses as one, otherwise text;
//  * an element with a <units> child is an angle whose <value> child is
//    converted to radians;
//  * an element with <elt> children is an array of numbers.
// Any other shape throws UnsupportedSchema.
#ifndef APERTUREFIELDS_H
#define APERTUREFIELDS_H

#include <map>
#include "Std.h"
#include "LinearAlgebra.h"
#include "XmlTree.h"
#include "yaml-cpp/yaml.h"

namespace siaf {

  class FieldValue {
  public:
    enum Kind {Number, Text, Angle, Array};
    FieldValue(): kind(Text), number(0.) {}
    static FieldValue makeNumber(double d);
    static FieldValue makeText(const string& s);
    // Angle value is in radians
    static FieldValue makeAngle(double radians);
    static FieldValue makeArray(const vector<double>& v);

    Kind getKind() const {return kind;}
    // Number and Angle both hold a numeric value
    bool isNumeric() const {return kind==Number || kind==Angle;}
    double getNumber() const;
    const string& getText() const;
    const vector<double>& getArray() const;

    void write(YAML::Emitter& os) const;
    static FieldValue create(const YAML::Node& node);
  private:
    Kind kind;
    double number;
    string text;
    vector<double> array;
  };

  std::ostream& operator<<(std::ostream& os, const FieldValue& v);

  class ApertureFields {
  public:
    ApertureFields() {}
    // Parse the children of a SiafEntry element
    explicit ApertureFields(const xmltree::Element& entry);

    bool has(const string& name) const {return fields.count(name)>0;}
    // Throws UnsupportedSchema if absent
    const FieldValue& get(const string& name) const;
    void set(const string& name, const FieldValue& v) {fields[name]=v;}
    void erase(const string& name) {fields.erase(name);}
    // Required-field helpers: throw UnsupportedSchema naming the field
    // if it is missing or of the wrong kind.
    double requireNumber(const string& name) const;
    string requireText(const string& name) const;

    typedef std::map<string,FieldValue>::const_iterator const_iterator;
    const_iterator begin() const {return fields.begin();}
    const_iterator end() const {return fields.end();}
    int size() const {return fields.size();}

    // Parse one child element into a value
    static FieldValue parseNode(const xmltree::Element& node);
  private:
    std::map<string,FieldValue> fields;
  };

} // namespace siaf

#endif // APERTUREFIELDS_H
