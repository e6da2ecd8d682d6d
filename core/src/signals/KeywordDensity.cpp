#include "reelcut/signals/KeywordDensity.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <sstream>

namespace reelcut {
namespace signals {

namespace {

bool is_strip_char(unsigned char c) {
    return std::isspace(c) || std::strchr(contract::KEYWORD_STRIP_CHARS, static_cast<int>(c)) != nullptr;
}

}  // namespace

std::string normalize_token(const std::string& text) {
    std::size_t a = 0;
    std::size_t b = text.size();
    while (a < b && is_strip_char(static_cast<unsigned char>(text[a]))) ++a;
    while (b > a && is_strip_char(static_cast<unsigned char>(text[b - 1]))) --b;
    std::string out = text.substr(a, b - a);
    for (auto& ch : out) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) ch = static_cast<char>(std::tolower(c));
    }
    return out;
}

KeywordDensityExtractor::KeywordDensityExtractor(const std::vector<std::string>& keywords, double windowSeconds)
    : window_(std::max(0.0, windowSeconds)) {
    for (const auto& kw : keywords) {
        std::istringstream in(kw);
        std::vector<std::string> tokens;
        std::string tok;
        while (in >> tok) {
            std::string norm = normalize_token(tok);
            if (!norm.empty()) tokens.push_back(std::move(norm));
        }
        if (tokens.empty()) continue;
        if (std::find(phrases_.begin(), phrases_.end(), tokens) == phrases_.end()) {
            phrases_.push_back(std::move(tokens));
        }
    }
}

std::vector<double> KeywordDensityExtractor::matchTimes(const std::vector<TimedWord>& words) const {
    std::vector<double> times;
    if (phrases_.empty() || words.empty()) return times;

    std::vector<std::string> norm;
    norm.reserve(words.size());
    for (const auto& w : words) norm.push_back(normalize_token(w.text));

    for (std::size_t i = 0; i < words.size(); ++i) {
        if (norm[i].empty() || !std::isfinite(words[i].start)) continue;
        for (const auto& phrase : phrases_) {
            if (i + phrase.size() > norm.size()) continue;
            bool match = true;
            for (std::size_t j = 0; j < phrase.size(); ++j) {
                if (norm[i + j] != phrase[j]) {
                    match = false;
                    break;
                }
            }
            if (match) times.push_back(words[i].start);
        }
    }
    std::sort(times.begin(), times.end());
    return times;
}

RawSignal KeywordDensityExtractor::extract(const std::vector<TimedWord>& words) const {
    RawSignal out;
    out.kind = SignalKind::KeywordDensity;
    out.impulse = true;

    const std::vector<double> matches = matchTimes(words);
    if (matches.empty()) return out;

    out.samples.reserve(words.size());
    for (const auto& w : words) {
        if (!std::isfinite(w.start)) continue;
        const auto lo = std::lower_bound(matches.begin(), matches.end(), w.start - window_);
        const auto hi = std::upper_bound(matches.begin(), matches.end(), w.start + window_);
        SignalSample s;
        s.timestamp = w.start;
        s.value = static_cast<double>(std::distance(lo, hi));
        out.samples.push_back(s);
    }
    std::stable_sort(out.samples.begin(), out.samples.end(),
                     [](const SignalSample& a, const SignalSample& b) { return a.timestamp < b.timestamp; });
    return out;
}

}  // namespace signals
}  // namespace reelcut
