#pragma once

#include <optional>
#include <string>

namespace fiscal::model {

    enum class TaxGroup {
        Unspecified = 0,
        TaxGroup1,
        TaxGroup2,
        TaxGroup3,
        TaxGroup4,
        TaxGroup5,
        TaxGroup6,
        TaxGroup7,
        TaxGroup8
    };

    enum class PaymentType {
        Cash,
        Check,
        Coupons,
        ExtCoupons,
        Packaging,
        InternalUsage,
        Damage,
        Card,
        Bank,
        Reserved1,
        Reserved2,
        Change
    };

    enum class PriceModifierType {
        None,
        DiscountPercent,
        DiscountAmount,
        SurchargePercent,
        SurchargeAmount
    };

    enum class ItemType {
        Sale,
        Comment,
        FooterComment,
        SurchargeAmount,
        DiscountAmount
    };

    enum class ReversalReason {
        OperatorError,
        Refund,
        TaxBaseReduction
    };

    enum class ReportType {
        Brief,
        Detailed
    };

    std::string toString(TaxGroup value);

    std::string toString(PaymentType value);

    std::string toString(PriceModifierType value);

    std::string toString(ItemType value);

    std::string toString(ReversalReason value);

    std::string toString(ReportType value);

    std::optional<TaxGroup> taxGroupFromNumber(int number);

    std::optional<PaymentType> paymentTypeFromString(const std::string &text);

    std::optional<PriceModifierType> priceModifierTypeFromString(const std::string &text);

    std::optional<ItemType> itemTypeFromString(const std::string &text);

    std::optional<ReversalReason> reversalReasonFromString(const std::string &text);

    std::optional<ReportType> reportTypeFromString(const std::string &text);

} // namespace fiscal::model
