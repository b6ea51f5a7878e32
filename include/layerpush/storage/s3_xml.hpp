#pragma once

#include <optional>
#include <string>
#include <vector>

// Minimal XML helpers for S3 request and response bodies (no regex, no DOM)
namespace layerpush::xml {

// Value between <tag>value</tag>, or empty if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0);

struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // Position after closing tag
};

// Every occurrence of <tag>...</tag>, in document order
std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag);

inline std::string element_content(const std::string& xml, const ElementRange& range) {
    return xml.substr(range.content_start, range.content_end - range.content_start);
}

// Decode the basic entity set S3 uses (&lt; &gt; &amp; &quot; &apos;)
std::string decode_entities(const std::string& s);

std::string escape(const std::string& s);

// <Error><Code>..</Code><Message>..</Message></Error>
struct S3Error {
    std::string code;
    std::string message;
};

std::optional<S3Error> parse_s3_error(const std::string& body);

std::string format_s3_error(const std::string& code, const std::string& message,
                            const std::string& resource = "");

} // namespace layerpush::xml
