#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "address.hpp"
#include "expected.hpp"
#include "../../logger/logger.hpp"


namespace metacat::link {


    struct LinkCodecConfig 
    {
        // parseOne rejects fallback text that itself carries '<' or a stray '>'
        bool strictFallbackDisplay{false};
        // extractAll keeps at most this many links; 0 = unlimited
        std::size_t maxLinksPerMessage{0};
    };


    /**
     * @brief Parses and renders entity links embedded in free-form text.
     *
     * Stateless apart from its configuration and logger, both fixed at construction,
     * so a single instance can be shared across threads.
     */
    class LinkCodec 
    {
    public:
        explicit LinkCodec(LinkCodecConfig cfg = {}, std::shared_ptr<logger::Logger> log = nullptr);

        /**
         * @brief Strict parse: the text must hold exactly one link, optionally with fallback display text.
         * malformedAddress when none is found, ambiguousAddress when more than one is.
         */
        Expected<Address> parseOne(std::string_view text) const;

        /**
         * @brief Lenient scan: every well-formed link in the text, left to right.
         * An empty vector when there is none.
         */
        Expected<std::vector<Address>> extractAll(std::string_view text) const;

        // <#E/{entityType}/{entityFQN}[/{fieldName}[/{arrayFieldName}[/{arrayFieldValue}]]]>
        std::string render(const Address& address) const;

        /**
         * @brief <#E/...|{displayText}>; an empty displayText renders the canonical form.
         * malformedAddress when displayText holds '<' or '>', which would hide the link from extractAll.
         */
        Expected<std::string> renderWithFallback(const Address& address, std::string_view displayText) const;

        const LinkCodecConfig& config() const noexcept { return cfg_; }

    private:
        Expected<Address> fromBody(std::string_view body) const;

        LinkCodecConfig cfg_{};
        std::shared_ptr<logger::Logger> log_;
    };


    // Default-configured codec without logging
    Expected<Address> parseOne(std::string_view text);
    Expected<std::vector<Address>> extractAll(std::string_view text);
    std::string render(const Address& address);


} // namespace metacat::link
