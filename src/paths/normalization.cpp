#include "pathguard/normalization.hpp"
#include "pathguard/platform.hpp"

#include <cctype>
#include <cstdio>
#include <optional>

#include <spdlog/spdlog.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>

namespace pathguard {

namespace {

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

// C0, DEL, C1 (which includes U+0085), and the Unicode line/paragraph separators
bool is_unsafe_control(UChar32 c) {
    return c <= 0x1F || (c >= 0x7F && c <= 0x9F) || c == 0x2028 || c == 0x2029;
}

bool is_confusable_dot(UChar32 c) {
    switch (c) {
        case 0x2024:  // ONE DOT LEADER
        case 0x2025:  // TWO DOT LEADER
        case 0x2026:  // HORIZONTAL ELLIPSIS
        case 0xFE19:  // PRESENTATION FORM FOR VERTICAL HORIZONTAL ELLIPSIS
        case 0xFE30:  // PRESENTATION FORM FOR VERTICAL TWO DOT LEADER
        case 0xFE52:  // SMALL FULL STOP
        case 0xFF0E:  // FULLWIDTH FULL STOP
        case 0xFF61:  // HALFWIDTH IDEOGRAPHIC FULL STOP
            return true;
        default:
            return false;
    }
}

bool is_dotdot_segment_at(const std::string& s, size_t i) {
    if (s.compare(i, 2, "..") != 0) return false;
    if (i > 0 && !is_separator(s[i - 1])) return false;
    return i + 2 == s.size() || is_separator(s[i + 2]);
}

std::string codepoint_label(UChar32 c) {
    char buf[16];
    snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(c));
    return buf;
}

bool is_valid_utf8(const std::string& s) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t length = static_cast<int32_t>(s.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) return false;
    }
    return true;
}

struct UnsafeMatch {
    SecurityReason reason;
    std::string text;
};

// First unsafe construct in string order
std::optional<UnsafeMatch> find_unsafe(const std::string& s, bool include_traversal) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t length = static_cast<int32_t>(s.size());
    int32_t i = 0;
    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) {
            return UnsafeMatch{SecurityReason::UNSAFE_UNICODE, "invalid UTF-8"};
        }
        if (include_traversal && c == '.' && is_dotdot_segment_at(s, static_cast<size_t>(start))) {
            return UnsafeMatch{SecurityReason::PATH_TRAVERSAL, ".."};
        }
        if (is_unsafe_control(c) || is_confusable_dot(c)) {
            return UnsafeMatch{SecurityReason::UNSAFE_UNICODE, codepoint_label(c)};
        }
    }
    return std::nullopt;
}

Result<std::string> to_nfkc(const std::string& path) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status)) {
        spdlog::error("NFKC normalizer unavailable: {}", u_errorName(status));
        return Result<std::string>::err(make_error(SecurityReason::NORMALIZATION_ERROR,
            std::string("Unicode normalization failed: ") + u_errorName(status), path));
    }

    icu::UnicodeString source = icu::UnicodeString::fromUTF8(path);
    icu::UnicodeString normalized = normalizer->normalize(source, status);
    if (U_FAILURE(status)) {
        return Result<std::string>::err(make_error(SecurityReason::NORMALIZATION_ERROR,
            std::string("Unicode normalization failed: ") + u_errorName(status), path));
    }

    std::string out;
    normalized.toUTF8String(out);
    return Result<std::string>::ok(out);
}

std::string collapse_separators(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out += c;
    }
    return out;
}

bool is_drive_absolute(const std::string& p) {
    return p.size() >= 3 && std::isalpha(static_cast<unsigned char>(p[0])) &&
           p[1] == ':' && p[2] == '/';
}

bool is_absolute(const std::string& p) {
    if (!p.empty() && p[0] == '/') return true;
    return get_current_platform() == Platform::Windows && is_drive_absolute(p);
}

} // namespace

Result<NormalizedPath> normalize(const std::string& path) {
    if (!is_valid_utf8(path)) {
        return Result<NormalizedPath>::err(make_error(SecurityReason::NORMALIZATION_ERROR,
            "Path is not valid UTF-8", path));
    }

    auto nfkc = to_nfkc(path);
    if (nfkc.isErr()) {
        return Result<NormalizedPath>::err(nfkc.error());
    }
    const std::string& text = nfkc.value();

    if (auto match = find_unsafe(text, true)) {
        bool traversal = match->reason == SecurityReason::PATH_TRAVERSAL;
        SecurityErrorContext ctx;
        ctx.path = path;
        ctx.detail = match->text;
        spdlog::debug("Normalization rejected {} ({})", path, match->text);
        return Result<NormalizedPath>::err(SecurityError(match->reason,
            traversal ? "Directory traversal not allowed" : "Path contains unsafe characters",
            std::move(ctx)));
    }

    std::string portable = collapse_separators(to_portable_path(text));

    if (!is_absolute(portable)) {
        auto cwd = get_current_directory();
        if (!cwd) {
            return Result<NormalizedPath>::err(make_error(SecurityReason::NORMALIZATION_ERROR,
                "Cannot determine current working directory", path));
        }
        portable = portable.empty() ? *cwd : *cwd + "/" + portable;
    }

    std::string normalized = lexically_normalize(collapse_separators(portable));
    return Result<NormalizedPath>::ok(NormalizedPath(std::move(normalized)));
}

Result<std::string> fold_case(const std::string& path) {
    icu::UnicodeString text = icu::UnicodeString::fromUTF8(path);
    text.foldCase(U_FOLD_CASE_DEFAULT);
    if (text.isBogus()) {
        return Result<std::string>::err(make_error(SecurityReason::CASE_MISMATCH,
            "Error normalizing path case", path));
    }
    std::string out;
    text.toUTF8String(out);
    return Result<std::string>::ok(out);
}

bool has_traversal_segment(const std::string& path) {
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        if (is_dotdot_segment_at(path, i)) return true;
    }
    return false;
}

bool has_suspicious_unicode(const std::string& path) {
    return find_unsafe(path, false).has_value();
}

} // namespace pathguard
