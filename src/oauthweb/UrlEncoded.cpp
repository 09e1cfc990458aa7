//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/UrlEncoded.cpp
// Purpose: urlencoded query and form parsing
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <string>

#include <boost/url/encode.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/param.hpp>
#include <boost/url/params_view.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/parse_query.hpp>
#include <boost/url/rfc/pchars.hpp>
#include <boost/url/url_view.hpp>

#include "env/EnvVars.h"
#include "oauthweb/UrlEncoded.hpp"
#include "oauthweb/errors/WebError.hpp"

namespace oauthweb {

namespace urls = boost::urls;

namespace {
    // Characters a query component may carry literally (RFC 3986 pchar, '/' and '?').
    const urls::grammar::lut_chars kQueryChars = urls::pchars + urls::grammar::lut_chars("/?");

    // Escapes what a strict URL grammar would reject: stray '%' not starting an escape becomes "%25",
    // other disallowed bytes are percent-encoded. Valid escapes pass through untouched.
    std::string repairEncoding(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (c == '%') {
                const bool escape = i + 2 < text.size() &&
                                    urls::grammar::hexdig_chars(text[i + 1]) &&
                                    urls::grammar::hexdig_chars(text[i + 2]);
                out += escape ? "%" : "%25";
            } else if (kQueryChars(c)) {
                out.push_back(c);
            } else {
                out += urls::encode(std::string_view(&text[i], 1), kQueryChars);
            }
        }
        return out;
    }

    // Replaces each byte that does not start a well-formed UTF-8 sequence with U+FFFD.
    std::string toUtf8Lossy(const std::string& s) {
        static const char kReplacement[] = "\xEF\xBF\xBD";
        std::string out;
        out.reserve(s.size());
        std::size_t i = 0;
        while (i < s.size()) {
            const auto c = static_cast<unsigned char>(s[i]);
            std::size_t len = 0;
            unsigned int cp = 0;
            if (c < 0x80) { out.push_back(s[i]); ++i; continue; }
            else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
            else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
            else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
            bool valid = len != 0 && i + len <= s.size();
            for (std::size_t k = 1; valid && k < len; ++k) {
                const auto cc = static_cast<unsigned char>(s[i + k]);
                valid = (cc & 0xC0) == 0x80;
                cp = (cp << 6) | (cc & 0x3F);
            }
            // Overlong forms, surrogates and values above U+10FFFF are not well-formed
            if (valid && ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
                          (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)) {
                valid = false;
            }
            if (valid) {
                out.append(s, i, len);
                i += len;
            } else {
                out += kReplacement;
                ++i;
            }
        }
        return out;
    }

    // Decoded parameters in order. Empty segments ("a=1&&b=2") are skipped.
    NormalizedParameter collect(const urls::params_view& view) {
        NormalizedParameter params;
        for (const urls::param& p : view) {
            if (p.key.empty() && !p.has_value) {
                continue;
            }
            params.Insert(toUtf8Lossy(p.key), p.has_value ? toUtf8Lossy(p.value) : std::string());
        }
        return params;
    }

    std::string trimLower(std::string_view v) {
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        auto b = std::find_if(v.begin(), v.end(), notSpace);
        auto e = std::find_if(v.rbegin(), v.rend(), notSpace).base();
        std::string out;
        if (b < e) {
            out.assign(b, e);
        }
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return out;
    }

    // Checks mime type and charset parameter of a Content-Type value.
    ParseStatus checkFormContentType(std::string_view contentType) {
        const auto semi = contentType.find(';');
        const std::string mime = trimLower(contentType.substr(0, semi));
        if (mime != "application/x-www-form-urlencoded") {
            return ParseStatus::NotForm;
        }
        if (semi == std::string_view::npos) {
            return ParseStatus::Ok;
        }
        std::string_view rest = contentType.substr(semi + 1);
        while (!rest.empty()) {
            const auto next = rest.find(';');
            const std::string param = trimLower(rest.substr(0, next));
            if (param.rfind("charset=", 0) == 0) {
                std::string cs = param.substr(8);
                if (cs.size() >= 2 && cs.front() == '"' && cs.back() == '"') {
                    cs = cs.substr(1, cs.size() - 2);
                }
                if (cs != "utf-8" && cs != "utf8") {
                    return ParseStatus::InvalidEncoding;
                }
            }
            if (next == std::string_view::npos) {
                break;
            }
            rest = rest.substr(next + 1);
        }
        return ParseStatus::Ok;
    }
}

const char* describe(ParseStatus status) {
    switch (status) {
        case ParseStatus::Ok: return "ok";
        case ParseStatus::NotForm: return "content type is not application/x-www-form-urlencoded";
        case ParseStatus::TooLarge: return "payload exceeds form size limit";
        case ParseStatus::InvalidEncoding: return "unsupported charset or undecodable payload";
        case ParseStatus::InvalidTarget: return "request target is not a valid URI reference";
    }
    return "unknown";
}

ParseResult parseUrlEncoded(std::string_view text) {
    const std::string repaired = repairEncoding(text);
    auto rv = urls::parse_query(repaired);
    if (!rv) {
        return ParseResult{ParseStatus::InvalidEncoding, std::nullopt};
    }
    const urls::params_view view(rv->buffer(), urls::encoding_opts(true));
    return ParseResult{ParseStatus::Ok, collect(view)};
}

ParseResult parseQuery(const HttpRequest& request) {
    const std::string target = repairEncoding(std::string_view(request.target().data(), request.target().size()));
    auto rv = urls::parse_uri_reference(target);
    if (!rv) {
        return ParseResult{ParseStatus::InvalidTarget, std::nullopt};
    }
    const urls::url_view& url = *rv;
    if (!url.has_query()) {
        return ParseResult{ParseStatus::Ok, NormalizedParameter()};
    }
    return ParseResult{ParseStatus::Ok, collect(url.params(urls::encoding_opts(true)))};
}

std::size_t formLimitFromEnv() {
    return GetEnvSizeOrDefault("OAUTHWEB_FORM_LIMIT", kDefaultFormLimit);
}

ParseResult parseForm(const HttpRequest& request, std::size_t limit) {
    auto it = request.find(http::field::content_type);
    if (it == request.end()) {
        return ParseResult{ParseStatus::NotForm, std::nullopt};
    }
    const ParseStatus ct = checkFormContentType(std::string_view(it->value().data(), it->value().size()));
    if (ct != ParseStatus::Ok) {
        return ParseResult{ct, std::nullopt};
    }
    if (request.body().size() > limit) {
        return ParseResult{ParseStatus::TooLarge, std::nullopt};
    }
    return parseUrlEncoded(request.body());
}

NormalizedParameter expectParsed(ParseResult result) {
    switch (result.status) {
        case ParseStatus::Ok:
            break;
        case ParseStatus::NotForm:
        case ParseStatus::TooLarge:
            throw WebError(WebError::Kind::Form, describe(result.status));
        case ParseStatus::InvalidEncoding:
        case ParseStatus::InvalidTarget:
            throw WebError(WebError::Kind::Encoding, describe(result.status));
    }
    return std::move(result.params.value());
}

} // namespace oauthweb
