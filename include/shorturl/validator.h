#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/validator.h — Syntactic checks for submitted URLs
// ═══════════════════════════════════════════════════════════════════
//
//    validator::isValid("freecodecamp.org")    -> true
//    validator::normalize("freecodecamp.org")  -> "http://freecodecamp.org"
//    validator::isValid("ftp://example.com")   -> false
//
//  Pure functions; nothing here touches the network.
// ═══════════════════════════════════════════════════════════════════

#include <optional>
#include <string>

namespace shorturl::validator {

// Components of an absolute URL. scheme and host are lower-cased;
// port is empty when absent; query and fragment keep their '?'/'#'.
struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

// Parse of an absolute URL after the WHATWG host rules, nullopt when
// it is not one. Tab, CR and LF are dropped from the input; hosts
// ending in a number are parsed as IPv4 ("0x7f.1" -> "127.0.0.1").
// Path, query and fragment are split but not percent-encoded.
std::optional<Url> parse(const std::string& input);

// Prefixes "http://" unless the input already starts with "http"
std::string normalize(const std::string& input);

// http/https after normalization, with a dotted hostname
bool isValid(const std::string& input);

// Hostname to resolve for the reachability probe, one leading "www." removed
std::optional<std::string> probeHost(const std::string& normalizedUrl);

} // namespace shorturl::validator
