#include "dentassist/core/types.hpp"

namespace dentassist {

void to_json(json& j, const Message& m) {
    j = json{
        {"role", m.role},
        {"content", m.content},
    };
}

} // namespace dentassist
