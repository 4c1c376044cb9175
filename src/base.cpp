#include "glua/base.hpp"

namespace glua {

bool source_loc::operator==(const source_loc& other) const {
    return this->filename == other.filename
        && this->line == other.line
        && this->col == other.col;
}

bool source_loc::operator!=(const source_loc& other) const {
    return !(*this == other);
}

string format_path(const key_path& keys) {
    string res;
    for (u32 i = 0; i < keys.size(); ++i) {
        if (i != 0) {
            res += '.';
        }
        res += keys[i];
    }
    return res;
}

}
