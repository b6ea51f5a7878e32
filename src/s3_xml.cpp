#include "layerpush/storage/s3_xml.hpp"

namespace layerpush::xml {

std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<ElementRange> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        ElementRange range;
        range.content_start = content_start;
        range.content_end = end;
        range.element_end = end + close_tag.length();
        results.push_back(range);

        pos = range.element_end;
    }

    return results;
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

std::optional<S3Error> parse_s3_error(const std::string& body) {
    auto ranges = find_elements(body, "Error");
    if (ranges.empty()) return std::nullopt;

    std::string content = element_content(body, ranges.front());
    S3Error err;
    err.code = decode_entities(get_element(content, "Code"));
    err.message = decode_entities(get_element(content, "Message"));
    if (err.code.empty() && err.message.empty()) return std::nullopt;
    return err;
}

std::string format_s3_error(const std::string& code, const std::string& message,
                            const std::string& resource) {
    std::string out = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Error><Code>" + escape(code) +
                      "</Code><Message>" + escape(message) + "</Message>";
    if (!resource.empty()) {
        out += "<Resource>" + escape(resource) + "</Resource>";
    }
    out += "</Error>";
    return out;
}

} // namespace layerpush::xml
