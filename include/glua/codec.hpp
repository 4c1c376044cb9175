// codec.hpp -- encoding host data into guest values and decoding it back

#ifndef __GLUA_CODEC_HPP
#define __GLUA_CODEC_HPP

#include "glua/base.hpp"
#include "glua/error.hpp"
#include "glua/state.hpp"
#include "glua/value.hpp"

#include <functional>
#include <type_traits>

namespace glua {

// An encoder turns a T into a value, threading the interpreter state. All of
// the primitive encoders below have this shape, and so does any lambda that
// builds a nested table with table().
template<typename T>
using encoder = std::function<step<value>(vm_state&&, const T&)>;

// A decoder checks the shape of a value and converts it to a T
template<typename T>
using decoder = std::function<result<T>(const value&)>;

// primitive encoders. These never fail and never touch the guest heap; the
// state is passed straight through.
step<value> encode_nil(vm_state&& state);
step<value> encode_bool(vm_state&& state, bool b);
step<value> encode_int(vm_state&& state, i64 i);
step<value> encode_float(vm_state&& state, f64 f);
step<value> encode_string(vm_state&& state, const string& s);

// Allocate a guest table holding the given key/value pairs. Fails with a
// runtime_error if a key is nil or NaN, and with stale_state if the handle is
// not current or a value belongs to another lineage.
result<step<value>> table(vm_state&& state,
        const std::vector<std::pair<value, value>>& entries);

// Encode each pair with its own key and value encoder, then build the table.
// The two encoders need not agree, e.g. string keys with float values.
template<typename K, typename V, typename KeyEnc, typename ValEnc>
result<step<value>> table(vm_state&& state,
        KeyEnc&& key_encoder,
        ValEnc&& value_encoder,
        const std::vector<std::pair<K, V>>& pairs) {
    std::vector<std::pair<value, value>> entries;
    entries.reserve(pairs.size());
    for (auto& p : pairs) {
        step<value> k = key_encoder(std::move(state), p.first);
        state = std::move(k.state);
        step<value> v = value_encoder(std::move(state), p.second);
        state = std::move(v.state);
        entries.emplace_back(std::move(k.out), std::move(v.out));
    }
    return table(std::move(state), entries);
}

// primitive decoders. A mismatch yields decode_failure{expected, observed}.
// Integers and floats are never converted into one another.
result<std::monostate> decode_nil(const value& v);
result<bool> decode_bool(const value& v);
result<i64> decode_int(const value& v);
result<f64> decode_float(const value& v);
result<string> decode_string(const value& v);
// succeeds for tables, functions and other guest objects
result<value_ref> decode_ref(const value& v);

// Read the entries of a guest table one level deep. Nested tables come back
// as references. Fails with decode_failure if v is not a table, or
// stale_state if its lineage has been discarded.
result<std::vector<std::pair<value, value>>> table_entries(const value& v);

template<typename Dec>
auto decode(const value& v, const Dec& dec) -> decltype(dec(v)) {
    return dec(v);
}

// Build a decoder for tables whose keys and values are decoded independently.
// Decoding fails on the first entry for which either decoder fails, and
// produces nothing in that case.
template<typename KeyDec, typename ValDec>
auto table_decoder(KeyDec key_decoder, ValDec value_decoder) {
    using K = typename std::invoke_result_t<KeyDec&, const value&>::value_type;
    using V = typename std::invoke_result_t<ValDec&, const value&>::value_type;
    using out_type = std::vector<std::pair<K, V>>;
    return [key_decoder, value_decoder](const value& v) -> result<out_type> {
        auto entries = table_entries(v);
        if (!entries) {
            return entries.error();
        }
        out_type out;
        out.reserve(entries.get().size());
        for (auto& e : entries.get()) {
            auto k = key_decoder(e.first);
            if (!k) {
                return k.error();
            }
            auto x = value_decoder(e.second);
            if (!x) {
                return x.error();
            }
            out.emplace_back(k.take(), x.take());
        }
        return out;
    };
}

}

#endif
