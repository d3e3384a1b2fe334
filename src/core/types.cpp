#include "core/types.hpp"
#include <sstream>

namespace flowscope {

std::string to_string(const InstrumentKey& key) {
    std::ostringstream oss;
    oss << key.strike << to_string(key.side);
    return oss.str();
}

}  // namespace flowscope
