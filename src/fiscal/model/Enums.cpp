#include "fiscal/model/Enums.hpp"

#include <array>
#include <utility>

namespace fiscal::model {

    namespace {
        template<typename E, size_t N>
        std::optional<E> lookup(const std::array<std::pair<E, const char *>, N> &names, const std::string &text) {
            for (const auto &[value, name]: names) {
                if (text == name) return value;
            }
            return std::nullopt;
        }

        template<typename E, size_t N>
        std::string nameOf(const std::array<std::pair<E, const char *>, N> &names, E value) {
            for (const auto &[v, name]: names) {
                if (v == value) return name;
            }
            return "unknown";
        }

        const std::array<std::pair<PaymentType, const char *>, 12> PAYMENT_TYPE_NAMES{{
            {PaymentType::Cash, "cash"},
            {PaymentType::Check, "check"},
            {PaymentType::Coupons, "coupons"},
            {PaymentType::ExtCoupons, "ext-coupons"},
            {PaymentType::Packaging, "packaging"},
            {PaymentType::InternalUsage, "internal-usage"},
            {PaymentType::Damage, "damage"},
            {PaymentType::Card, "card"},
            {PaymentType::Bank, "bank"},
            {PaymentType::Reserved1, "reserved1"},
            {PaymentType::Reserved2, "reserved2"},
            {PaymentType::Change, "change"}
        }};

        const std::array<std::pair<PriceModifierType, const char *>, 5> PRICE_MODIFIER_NAMES{{
            {PriceModifierType::None, "none"},
            {PriceModifierType::DiscountPercent, "discount-percent"},
            {PriceModifierType::DiscountAmount, "discount-amount"},
            {PriceModifierType::SurchargePercent, "surcharge-percent"},
            {PriceModifierType::SurchargeAmount, "surcharge-amount"}
        }};

        const std::array<std::pair<ItemType, const char *>, 5> ITEM_TYPE_NAMES{{
            {ItemType::Sale, "sale"},
            {ItemType::Comment, "comment"},
            {ItemType::FooterComment, "footer-comment"},
            {ItemType::SurchargeAmount, "surcharge-amount"},
            {ItemType::DiscountAmount, "discount-amount"}
        }};

        const std::array<std::pair<ReversalReason, const char *>, 3> REVERSAL_REASON_NAMES{{
            {ReversalReason::OperatorError, "operator-error"},
            {ReversalReason::Refund, "refund"},
            {ReversalReason::TaxBaseReduction, "taxbase-reduction"}
        }};

        const std::array<std::pair<ReportType, const char *>, 2> REPORT_TYPE_NAMES{{
            {ReportType::Brief, "brief"},
            {ReportType::Detailed, "detailed"}
        }};
    }

    std::string toString(TaxGroup value) {
        if (value == TaxGroup::Unspecified) return "unspecified";
        return "TaxGroup" + std::to_string(static_cast<int>(value));
    }

    std::string toString(PaymentType value) {
        return nameOf(PAYMENT_TYPE_NAMES, value);
    }

    std::string toString(PriceModifierType value) {
        return nameOf(PRICE_MODIFIER_NAMES, value);
    }

    std::string toString(ItemType value) {
        return nameOf(ITEM_TYPE_NAMES, value);
    }

    std::string toString(ReversalReason value) {
        return nameOf(REVERSAL_REASON_NAMES, value);
    }

    std::string toString(ReportType value) {
        return nameOf(REPORT_TYPE_NAMES, value);
    }

    std::optional<TaxGroup> taxGroupFromNumber(int number) {
        if (number < 1 || number > 8) return std::nullopt;
        return static_cast<TaxGroup>(number);
    }

    std::optional<PaymentType> paymentTypeFromString(const std::string &text) {
        return lookup(PAYMENT_TYPE_NAMES, text);
    }

    std::optional<PriceModifierType> priceModifierTypeFromString(const std::string &text) {
        return lookup(PRICE_MODIFIER_NAMES, text);
    }

    std::optional<ItemType> itemTypeFromString(const std::string &text) {
        return lookup(ITEM_TYPE_NAMES, text);
    }

    std::optional<ReversalReason> reversalReasonFromString(const std::string &text) {
        return lookup(REVERSAL_REASON_NAMES, text);
    }

    std::optional<ReportType> reportTypeFromString(const std::string &text) {
        return lookup(REPORT_TYPE_NAMES, text);
    }

} // namespace fiscal::model
