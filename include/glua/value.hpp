// value.hpp -- host-side representation of guest values

#ifndef __GLUA_VALUE_HPP
#define __GLUA_VALUE_HPP

#include "glua/base.hpp"

#include <ostream>
#include <variant>

namespace glua {

enum value_tag {
    vt_nil,
    vt_bool,
    vt_int,
    vt_float,
    vt_string,
    vt_table,
    vt_function,
    // userdata, light userdata and coroutines
    vt_ref
};

const char* tag_name(value_tag tag);

// A guest object pinned in the Lua registry of one lineage. Defined in the
// library sources; the registry slot is released when the last owner goes
// away, provided the lineage is still alive.
struct guest_ref;

// A guest value as seen from the host. Nil, booleans, numbers and strings are
// copied out of the interpreter. Tables, functions and other objects are held
// by reference and stay in the guest heap; they are only valid while their
// lineage is alive.
class value {
public:
    // nil
    value() = default;
    explicit value(bool b);
    // integer literals land here, e.g. value{1}. Stored as an i64.
    explicit value(int i);
    explicit value(i64 i);
    explicit value(f64 f);
    explicit value(const string& s);
    explicit value(string&& s);
    // without this, string literals would convert to bool
    explicit value(const char* s);

    value_tag tag() const;
    bool is_nil() const {
        return tag() == vt_nil;
    }

    // unchecked accessors. Use the decoders in codec.hpp for checked access.
    bool as_bool() const;
    i64 as_int() const;
    f64 as_float() const;
    const string& as_string() const;

    // the guest object behind a table, function or ref value. Null for
    // primitive values.
    const shared_ptr<const guest_ref>& guest() const;

    // Primitives compare by value. Guest objects compare by identity, i.e. two
    // values are equal if they refer to the same table or function.
    bool operator==(const value& other) const;
    bool operator!=(const value& other) const {
        return !(*this == other);
    }

private:
    std::variant<std::monostate, bool, i64, f64, string,
        shared_ptr<const guest_ref>> data;

    explicit value(shared_ptr<const guest_ref> ref);
    friend struct value_access;
};

typedef std::vector<value> value_list;

// An opaque handle to a guest value that is never decoded. This is what call()
// accepts as a target.
class value_ref {
public:
    value_tag tag() const;
    // the lineage this reference belongs to
    u64 lineage() const;
    // false once every handle of the lineage has been destroyed
    bool alive() const;

private:
    shared_ptr<const guest_ref> ref;

    explicit value_ref(shared_ptr<const guest_ref> ref);
    friend struct value_access;
};

// format a value for diagnostics. Strings are quoted only if quote_strings is
// set. Guest objects are shown as their tag name and registry slot.
string to_string(const value& v, bool quote_strings=false);
std::ostream& operator<<(std::ostream& out, const value& v);

}

#endif
