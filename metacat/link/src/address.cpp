#include <sstream>
#include <string_view>
#include "../include/address.hpp"


namespace metacat::link {


    const char* toString(LinkKind kind) {
        switch (kind) {
            case LinkKind::entity:     return "ENTITY";
            case LinkKind::field:      return "FIELD";
            case LinkKind::arrayField: return "ARRAY_FIELD";
        }
        return "ENTITY";
    }


    const char* toString(ErrorCode code) {
        switch (code) {
            case ErrorCode::malformedAddress:    return "MalformedAddress";
            case ErrorCode::ambiguousAddress:    return "AmbiguousAddress";
            case ErrorCode::invalidSegmentOrder: return "InvalidSegmentOrder";
        }
        return "MalformedAddress";
    }


    static bool hasAny(std::string_view s, std::string_view chars) {
        return s.find_first_of(chars) != std::string_view::npos;
    }

    static void dropIfEmpty(std::optional<std::string>& s) {
        if (s && s->empty()) s.reset();
    }


    Expected<Address> Address::make(std::string entityType, std::string entityFqn,
        std::optional<std::string> fieldName,
        std::optional<std::string> arrayFieldName,
        std::optional<std::string> arrayFieldValue)
    {
        using R = Expected<Address>;

        if (entityType.empty() || entityFqn.empty()) {
            return R::failure(ErrorCode::malformedAddress, "Entity link must have both {entityType} and {entityFQN}");
        }

        dropIfEmpty(fieldName);
        dropIfEmpty(arrayFieldName);
        dropIfEmpty(arrayFieldValue);

        if (arrayFieldValue && !arrayFieldName) {
            return R::failure(ErrorCode::invalidSegmentOrder, "Entity link has {arrayFieldValue} without {arrayFieldName}");
        }
        if (arrayFieldName && !fieldName) {
            return R::failure(ErrorCode::invalidSegmentOrder, "Entity link has {arrayFieldName} without {fieldName}");
        }

        // '<', '>' and '|' are reserved; only the last segment may hold '/'
        if (hasAny(entityType, "<>/|")) {
            return R::failure(ErrorCode::malformedAddress, "Invalid {entityType} in entity link: " + entityType);
        }
        if (hasAny(entityFqn, "<>/|")) {
            return R::failure(ErrorCode::malformedAddress, "Invalid {entityFQN} in entity link: " + entityFqn);
        }
        if (fieldName && hasAny(*fieldName, "<>/|")) {
            return R::failure(ErrorCode::malformedAddress, "Invalid {fieldName} in entity link: " + *fieldName);
        }
        if (arrayFieldName && hasAny(*arrayFieldName, "<>/|")) {
            return R::failure(ErrorCode::malformedAddress, "Invalid {arrayFieldName} in entity link: " + *arrayFieldName);
        }
        if (arrayFieldValue && hasAny(*arrayFieldValue, "<>|")) {
            return R::failure(ErrorCode::malformedAddress, "Invalid {arrayFieldValue} in entity link: " + *arrayFieldValue);
        }

        Address a;
        a.entityType_ = std::move(entityType);
        a.entityFqn_ = std::move(entityFqn);
        a.fieldName_ = std::move(fieldName);
        a.arrayFieldName_ = std::move(arrayFieldName);
        a.arrayFieldValue_ = std::move(arrayFieldValue);

        if (a.arrayFieldName_) {
            a.kind_ = LinkKind::arrayField;
            a.qualifiedType_ = a.entityType_ + "." + *a.fieldName_ + ".member";
            a.qualifiedValue_ = a.entityFqn_ + "." + *a.arrayFieldName_;
            if (a.arrayFieldValue_) a.qualifiedValue_ += "." + *a.arrayFieldValue_;
        } else if (a.fieldName_) {
            a.kind_ = LinkKind::field;
            a.qualifiedType_ = a.entityType_ + "." + *a.fieldName_;
            a.qualifiedValue_ = a.entityFqn_ + "." + *a.fieldName_;
        } else {
            a.kind_ = LinkKind::entity;
            a.qualifiedType_ = a.entityType_;
            a.qualifiedValue_ = a.entityFqn_;
        }

        return R::success(std::move(a));
    }


    std::string Address::toString() const {
        auto orNull = [](const std::optional<std::string>& s) -> const std::string& {
            static const std::string null = "null";
            return s ? *s : null;
        };

        std::ostringstream oss;
        oss << "EntityLink { type = " << link::toString(kind_)
            << ", entityType = " << entityType_
            << ", entityFQN = " << entityFqn_
            << ", fieldName = " << orNull(fieldName_)
            << ", arrayFieldName = " << orNull(arrayFieldName_)
            << ", arrayFieldValue = " << orNull(arrayFieldValue_)
            << " }";
        return oss.str();
    }


} // namespace metacat::link


namespace std {

    std::size_t hash<metacat::link::Address>::operator()(const metacat::link::Address& a) const noexcept {
        std::hash<std::string> hs;
        auto mix = [](std::size_t seed, std::size_t h) {
            return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
        };

        std::size_t seed = static_cast<std::size_t>(a.kind());
        seed = mix(seed, hs(a.entityType()));
        seed = mix(seed, hs(a.entityFqn()));
        seed = mix(seed, a.fieldName() ? hs(*a.fieldName()) : 0);
        seed = mix(seed, a.arrayFieldName() ? hs(*a.arrayFieldName()) : 0);
        seed = mix(seed, a.arrayFieldValue() ? hs(*a.arrayFieldValue()) : 0);
        return seed;
    }

} // namespace std
