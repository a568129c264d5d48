#include <array>
#include "../include/grammar.hpp"


namespace metacat::link::grammar {


    std::string stripFallbackDisplay(std::string_view text) {
        const size_t pipe = text.find(kFallbackSeparator);
        if (pipe == std::string_view::npos) return std::string(text);

        std::string out(text.substr(0, pipe));
        out.push_back(kCloseToken);
        return out;
    }


    bool hasSafeFallbackDisplay(std::string_view text) {
        const size_t pipe = text.find(kFallbackSeparator);
        if (pipe == std::string_view::npos) return true;

        const std::string_view fallback = text.substr(pipe + 1);
        if (fallback.find('<') != std::string_view::npos) return false;

        const size_t close = fallback.find(kCloseToken);
        return close != std::string_view::npos && close + 1 == fallback.size();
    }


    Expected<Segments> splitBody(std::string_view body) {
        using R = Expected<Segments>;

        if (body.find_first_of("<>") != std::string_view::npos) {
            return R::failure(ErrorCode::malformedAddress, "Entity link body contains a delimiter: " + std::string(body));
        }

        // tokens[0..n), the last one keeps any remaining '/'
        std::array<std::string_view, kMaxSegments> tokens{};
        size_t n = 0;
        std::string_view rest = body;
        while (n + 1 < kMaxSegments) {
            const size_t slash = rest.find(kSegmentSeparator);
            if (slash == std::string_view::npos) break;
            tokens[n++] = rest.substr(0, slash);
            rest = rest.substr(slash + 1);
        }
        tokens[n++] = rest;

        while (n > 0 && tokens[n - 1].empty()) --n;

        if (n < 2 || tokens[0].empty() || tokens[1].empty()) {
            return R::failure(ErrorCode::malformedAddress, "Entity link must have both {entityType} and {entityFQN}: " + std::string(body));
        }

        // an empty interior segment means a later segment lost its parent
        for (size_t i = 2; i < n; ++i) {
            if (tokens[i].empty()) {
                return R::failure(ErrorCode::invalidSegmentOrder, "Entity link has an empty segment before a nested one: " + std::string(body));
            }
        }

        Segments seg;
        seg.entityType = std::string(tokens[0]);
        seg.entityFqn = std::string(tokens[1]);
        if (n > 2) seg.fieldName = std::string(tokens[2]);
        if (n > 3) seg.arrayFieldName = std::string(tokens[3]);
        if (n > 4) seg.arrayFieldValue = std::string(tokens[4]);
        return R::success(std::move(seg));
    }


    std::vector<TokenSpan> scanTokens(std::string_view text) {
        std::vector<TokenSpan> out;
        size_t pos = 0;

        while (pos < text.size()) {
            const size_t open = text.find(kOpenToken, pos);
            if (open == std::string_view::npos) break;

            const size_t bodyStart = open + kOpenToken.size();
            const size_t stop = text.find_first_of("<>", bodyStart);
            if (stop == std::string_view::npos) break;

            // nested '<' abandons this candidate; it may open the next one
            if (text[stop] != kCloseToken) {
                pos = stop;
                continue;
            }

            std::string_view body = text.substr(bodyStart, stop - bodyStart);
            const size_t pipe = body.find(kFallbackSeparator);
            if (pipe != std::string_view::npos) body = body.substr(0, pipe);

            if (splitBody(body).has_value()) {
                out.push_back(TokenSpan{open, stop + 1 - open, std::string(body)});
            }
            pos = stop + 1;
        }

        return out;
    }

} // namespace metacat::link::grammar
