#pragma once
#include <string>
#include "core/errors.hpp"
#include "core/expected.hpp"

namespace dub {

class Translator {
public:
    virtual ~Translator() = default;

    // Errors carry ErrorCode::Translation.
    virtual core::Expected<std::string, core::Error> translate(
        const std::string& text, const std::string& target_language, const std::string& source_language) = 0;
};

}
