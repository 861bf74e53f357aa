#include <poolhub/common/error.hpp>

#include <cstdio>
#include <sstream>

namespace poolhub::common {

namespace {

void write_headline(std::ostringstream& out, const Error& error) {
    char code_hex[8];
    std::snprintf(code_hex, sizeof(code_hex), "0x%04x", static_cast<unsigned>(error.code()));

    out << '[' << category_name(error.category()) << "] " << error_name(error.code()) << " ("
        << code_hex << ')';
    if (!error.message().empty()) {
        out << ": " << error.message();
    }
}

void write_details(std::ostringstream& out, const Error& error) {
    const auto& loc = error.location();
    if (loc.is_valid()) {
        out << "\n    at " << loc.file << ':' << loc.line;
        if (loc.function[0] != '\0') {
            out << " in " << loc.function;
        }
    }
    for (const auto& [key, value] : error.context()) {
        out << "\n    " << key << ": " << value;
    }
}

}  // anonymous namespace

std::string Error::to_string() const {
    std::ostringstream out;
    write_headline(out, *this);
    write_details(out, *this);

    for (const Error* cause = cause_.get(); cause != nullptr; cause = cause->cause()) {
        out << "\n  Caused by: ";
        write_headline(out, *cause);
        write_details(out, *cause);
    }
    return out.str();
}

Error& Error::with_context(std::string_view key, std::string_view value) {
    context_.emplace_back(std::string(key), std::string(value));
    return *this;
}

}  // namespace poolhub::common
