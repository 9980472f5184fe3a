// ═══════════════════════════════════════════════════════════════════
//  validator.cpp — URL parsing and acceptance rules
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/validator.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cctype>
#include <string_view>
#include <vector>

namespace shorturl::validator {

namespace {

constexpr std::array<std::string_view, 6> kSpecialSchemes = {
    "http", "https", "ws", "wss", "ftp", "file"
};

bool isSpecial(const std::string& scheme) {
    return std::find(kSpecialSchemes.begin(), kSpecialSchemes.end(), scheme)
        != kSpecialSchemes.end();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto isSpace = [](unsigned char c) { return c <= 0x20; };
    auto begin = std::find_if_not(s.begin(), s.end(), isSpace);
    auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexDigit(s[i + 1]);
            int lo = hexDigit(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

bool isForbiddenHostChar(unsigned char c) {
    if (c <= 0x20 || c == 0x7F) return true;
    switch (c) {
        case '#': case '%': case '/': case ':': case '<': case '>':
        case '?': case '@': case '[': case '\\': case ']': case '^': case '|':
            return true;
        default:
            return false;
    }
}

bool allDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string_view> splitLabels(std::string_view host) {
    std::vector<std::string_view> labels;
    std::size_t start = 0;
    while (true) {
        auto dot = host.find('.', start);
        labels.push_back(host.substr(start, dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return labels;
}

// One dotted part: decimal, 0x-prefixed hex, or 0-prefixed octal
std::optional<std::uint64_t> parseIpv4Number(std::string_view part) {
    if (part.empty()) return std::nullopt;

    int base = 10;
    if (part.size() >= 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X')) {
        base = 16;
        part.remove_prefix(2);
    } else if (part.size() >= 2 && part[0] == '0') {
        base = 8;
        part.remove_prefix(1);
    }
    if (part.empty()) return 0;
    if (part.size() > 12) return std::nullopt;

    std::uint64_t value = 0;
    for (char c : part) {
        int digit = hexDigit(c);
        if (digit < 0 || digit >= base) return std::nullopt;
        value = value * static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(digit);
    }
    return value;
}

// Hosts whose last label is numeric go through the IPv4 parser
bool endsInNumber(std::string_view host) {
    auto labels = splitLabels(host);
    if (labels.back().empty()) {
        if (labels.size() == 1) return false;
        labels.pop_back();
    }
    auto last = labels.back();
    return allDigits(last) || parseIpv4Number(last).has_value();
}

// Accepts the short and radix forms ("1.2.3", "0x7f.1") and returns
// the dotted-quad serialization, or nullopt when out of range
std::optional<std::string> parseIpv4(std::string_view host) {
    auto labels = splitLabels(host);
    if (labels.size() > 1 && labels.back().empty()) labels.pop_back();
    if (labels.size() > 4) return std::nullopt;

    std::vector<std::uint64_t> numbers;
    for (auto label : labels) {
        auto n = parseIpv4Number(label);
        if (!n) return std::nullopt;
        numbers.push_back(*n);
    }

    for (std::size_t i = 0; i + 1 < numbers.size(); ++i) {
        if (numbers[i] > 255) return std::nullopt;
    }
    const std::uint64_t limit = std::uint64_t{1} << (8 * (5 - numbers.size()));
    if (numbers.back() >= limit) return std::nullopt;

    std::uint64_t address = numbers.back();
    for (std::size_t i = 0; i + 1 < numbers.size(); ++i) {
        address += numbers[i] << (8 * (3 - i));
    }

    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

bool isIpv6Literal(const std::string& host) {
    if (host.size() < 3 || host.front() != '[' || host.back() != ']') return false;
    return std::all_of(host.begin() + 1, host.end() - 1, [](unsigned char c) {
        return std::isxdigit(c) || c == ':' || c == '.';
    });
}

std::optional<std::string> parseHost(const std::string& raw) {
    if (raw.empty()) return std::nullopt;
    if (raw.front() == '[') {
        if (!isIpv6Literal(raw)) return std::nullopt;
        return toLower(raw);
    }

    auto host = toLower(percentDecode(raw));
    if (host.empty()) return std::nullopt;
    for (unsigned char c : host) {
        if (isForbiddenHostChar(c)) return std::nullopt;
    }
    if (endsInNumber(host)) return parseIpv4(host);
    return host;
}

// Splits authority into host and port; port must be 0-65535 when present
bool splitHostPort(const std::string& hostPort, std::string& host, std::string& port) {
    std::size_t colon = std::string::npos;
    if (!hostPort.empty() && hostPort.front() == '[') {
        auto close = hostPort.find(']');
        if (close == std::string::npos) return false;
        if (close + 1 < hostPort.size()) {
            if (hostPort[close + 1] != ':') return false;
            colon = close + 1;
        }
    } else {
        colon = hostPort.rfind(':');
    }

    if (colon == std::string::npos) {
        host = hostPort;
        port.clear();
        return true;
    }

    host = hostPort.substr(0, colon);
    port = hostPort.substr(colon + 1);
    if (port.empty()) return true;
    if (!allDigits(port) || port.size() > 5 || std::stoi(port) > 65535) return false;
    return true;
}

} // namespace

std::optional<Url> parse(const std::string& input) {
    std::string s = trim(input);
    s.erase(std::remove_if(s.begin(), s.end(),
                           [](char c) { return c == '\t' || c == '\n' || c == '\r'; }),
            s.end());
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front()))) {
        return std::nullopt;
    }

    std::size_t colon = 0;
    while (colon < s.size()) {
        unsigned char c = s[colon];
        if (c == ':') break;
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return std::nullopt;
        ++colon;
    }
    if (colon == s.size()) return std::nullopt;

    Url url;
    url.scheme = toLower(s.substr(0, colon));
    std::string rest = s.substr(colon + 1);

    auto hashPos = rest.find('#');
    if (hashPos != std::string::npos) {
        url.fragment = rest.substr(hashPos);
        rest.erase(hashPos);
    }

    const bool special = isSpecial(url.scheme);
    bool hasAuthority = false;
    if (special) {
        // Special schemes tolerate any run of '/' or '\' before the host
        std::size_t i = 0;
        while (i < rest.size() && (rest[i] == '/' || rest[i] == '\\')) ++i;
        rest.erase(0, i);
        hasAuthority = true;
    } else if (rest.compare(0, 2, "//") == 0) {
        rest.erase(0, 2);
        hasAuthority = true;
    }

    if (hasAuthority) {
        auto end = rest.find_first_of(special ? "/\\?" : "/?");
        std::string authority = rest.substr(0, end);
        rest = end == std::string::npos ? std::string() : rest.substr(end);

        auto at = authority.rfind('@');
        std::string hostPort = at == std::string::npos ? authority : authority.substr(at + 1);

        std::string rawHost;
        if (!splitHostPort(hostPort, rawHost, url.port)) return std::nullopt;

        if (rawHost.empty()) {
            if (special && url.scheme != "file") return std::nullopt;
        } else {
            auto host = parseHost(rawHost);
            if (!host) return std::nullopt;
            url.host = *host;
        }
    }

    auto queryPos = rest.find('?');
    if (queryPos != std::string::npos) {
        url.query = rest.substr(queryPos);
        rest.erase(queryPos);
    }
    url.path = rest;
    if (special && url.path.empty()) url.path = "/";

    return url;
}

std::string normalize(const std::string& input) {
    return input.rfind("http", 0) == 0 ? input : "http://" + input;
}

bool isValid(const std::string& input) {
    auto url = parse(normalize(input));
    if (!url) return false;
    if (url->scheme != "http" && url->scheme != "https") return false;
    return url->host.find('.') != std::string::npos;
}

std::optional<std::string> probeHost(const std::string& normalizedUrl) {
    auto url = parse(normalizedUrl);
    if (!url || url->host.empty()) return std::nullopt;

    std::string host = url->host;
    if (host.rfind("www.", 0) == 0) {
        host.erase(0, 4);
    }
    return host;
}

} // namespace shorturl::validator
