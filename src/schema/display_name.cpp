#include "schema/display_name.hpp"

#include <cctype>

namespace argrun::schema {

namespace {

// Bytes of multi-byte UTF-8 sequences count as word characters so that
// non-ASCII identifiers are not split apart.
bool is_word_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0;
}

bool is_lower(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

char to_lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

char to_upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

} // namespace

std::string to_sentence_case(std::string_view id) {
    while (!id.empty() && !is_word_char(id.back())) {
        id.remove_suffix(1);
    }

    std::string result;
    result.reserve(id.size() * 2);

    bool new_word = true;
    bool first_word = true;
    bool found_real_char = false;
    char last_char = ' ';

    for (char c : id) {
        if (!is_word_char(c)) {
            if (found_real_char) {
                new_word = true;
            }
            continue;
        }

        found_real_char = true;

        if (std::isdigit(static_cast<unsigned char>(c))) {
            new_word = true;
            result.push_back(c);
        } else if (new_word || (is_lower(last_char) && is_upper(c))) {
            new_word = false;
            if (!first_word) {
                result.push_back(' ');
            }
            result.push_back(first_word ? to_upper(c) : to_lower(c));
            first_word = false;
        } else {
            last_char = c;
            result.push_back(to_lower(c));
        }
    }

    return result;
}

} // namespace argrun::schema
