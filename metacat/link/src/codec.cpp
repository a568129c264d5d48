#include "../include/codec.hpp"
#include "../include/grammar.hpp"


namespace metacat::link {

    using logger::LogLevel;
    using logger::LogRecord;


    LinkCodec::LinkCodec(LinkCodecConfig cfg, std::shared_ptr<logger::Logger> log)
        : cfg_(cfg), log_(std::move(log)) {}


    Expected<Address> LinkCodec::fromBody(std::string_view body) const 
    {
        auto seg = grammar::splitBody(body);
        if (!seg.has_value()) return Expected<Address>::failure(*seg.error);

        auto& s = seg.get();
        return Address::make(std::move(s.entityType), std::move(s.entityFqn),
            std::move(s.fieldName), std::move(s.arrayFieldName), std::move(s.arrayFieldValue));
    }


    Expected<Address> LinkCodec::parseOne(std::string_view text) const 
    {
        using R = Expected<Address>;

        if (cfg_.strictFallbackDisplay && !grammar::hasSafeFallbackDisplay(text)) {
            MC_LOG(log_, LogLevel::debug) << "rejected unsafe fallback display text";
            return R::failure(ErrorCode::malformedAddress, "Entity link fallback text contains a delimiter in " + std::string(text));
        }

        const std::string link = grammar::stripFallbackDisplay(text);
        const auto tokens = grammar::scanTokens(link);

        if (tokens.empty()) {
            MC_LOG(log_, LogLevel::debug) << "no entity link in input of " << text.size() << " bytes";
            return R::failure(ErrorCode::malformedAddress, "Entity link was not found in " + link);
        }
        if (tokens.size() > 1) {
            MC_LOG(log_, LogLevel::debug) << "found " << tokens.size() << " entity links where one was expected";
            return R::failure(ErrorCode::ambiguousAddress, "Unexpected multiple entity links in " + link);
        }

        auto res = fromBody(tokens.front().body);
        if (log_ && log_->level() <= LogLevel::trace && res.has_value()) {
            LogRecord rec;
            rec.level = LogLevel::trace;
            rec.logger = "LinkCodec";
            rec.msg = "parsed entity link";
            rec.input = link;
            rec.token = render(res.get());
            rec.kind = toString(res.get().kind());
            rec.offset = static_cast<long>(tokens.front().offset);
            log_->log(std::move(rec));
        }
        return res;
    }


    Expected<std::vector<Address>> LinkCodec::extractAll(std::string_view text) const 
    {
        using R = Expected<std::vector<Address>>;

        auto tokens = grammar::scanTokens(text);
        if (cfg_.maxLinksPerMessage != 0 && tokens.size() > cfg_.maxLinksPerMessage) {
            if (log_) {
                LogRecord rec;
                rec.level = LogLevel::warn;
                rec.logger = "LinkCodec";
                rec.msg = "entity links truncated to " + std::to_string(cfg_.maxLinksPerMessage);
                rec.count = static_cast<long>(tokens.size());
                log_->log(std::move(rec));
            }
            tokens.resize(cfg_.maxLinksPerMessage);
        }

        std::vector<Address> links;
        links.reserve(tokens.size());

        for (auto const& tok : tokens) {
            auto res = fromBody(tok.body);
            if (!res.has_value()) {
                // The scanner only yields bodies splitBody accepts
                MC_LOG(log_, LogLevel::error) << "scanned token failed to parse at offset " << tok.offset
                                              << ": " << res.error->message;
                return R::failure(*res.error);
            }
            links.push_back(std::move(res.get()));
        }

        MC_LOG(log_, LogLevel::debug) << "extracted " << links.size() << " entity links";
        return R::success(std::move(links));
    }


    std::string LinkCodec::render(const Address& a) const 
    {
        std::string out(grammar::kOpenToken);
        out += a.entityType();
        out += grammar::kSegmentSeparator;
        out += a.entityFqn();

        if (a.kind() == LinkKind::field || a.kind() == LinkKind::arrayField) {
            out += grammar::kSegmentSeparator;
            out += *a.fieldName();
        }
        if (a.kind() == LinkKind::arrayField) {
            out += grammar::kSegmentSeparator;
            out += *a.arrayFieldName();
            if (a.arrayFieldValue()) {
                out += grammar::kSegmentSeparator;
                out += *a.arrayFieldValue();
            }
        }

        out += grammar::kCloseToken;
        return out;
    }


    Expected<std::string> LinkCodec::renderWithFallback(const Address& a, std::string_view displayText) const 
    {
        using R = Expected<std::string>;

        if (displayText.find_first_of("<>") != std::string_view::npos) {
            return R::failure(ErrorCode::malformedAddress, "Entity link fallback text contains a delimiter: " + std::string(displayText));
        }

        std::string out = render(a);
        if (displayText.empty()) return R::success(std::move(out));

        out.pop_back();
        out += grammar::kFallbackSeparator;
        out += displayText;
        out += grammar::kCloseToken;
        return R::success(std::move(out));
    }


    Expected<Address> parseOne(std::string_view text) { return LinkCodec{}.parseOne(text); }

    Expected<std::vector<Address>> extractAll(std::string_view text) { return LinkCodec{}.extractAll(text); }

    std::string render(const Address& address) { return LinkCodec{}.render(address); }


} // namespace metacat::link
