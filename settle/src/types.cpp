#include "types.hpp"
#include <algorithm>

SplitType Expense::split_type() const {
    if (std::holds_alternative<EqualSplit>(split)) {
        return SplitType::EQUAL;
    }
    if (std::holds_alternative<WeightedSplit>(split)) {
        return SplitType::WEIGHTED;
    }
    return SplitType::ITEMIZED;
}

void to_json(nlohmann::json& j, const Expense& expense) {
    j = nlohmann::json{
        {"id", expense.id},
        {"payer_user_id", expense.payer_user_id},
        {"currency", expense.currency},
        {"amount", expense.amount},
        {"category_id", expense.category_id},
        {"participants", expense.participants},
        {"split_type", expense.split_type()}
    };
    if (const auto* itemized = expense.itemized()) {
        j["participant_amounts"] = itemized->participant_amounts;
        j["items"] = itemized->items;
        j["extras"] = itemized->extras;
        j["allocation"] = itemized->allocation;
    }
}

void from_json(const nlohmann::json& j, Expense& expense) {
    j.at("id").get_to(expense.id);
    j.at("payer_user_id").get_to(expense.payer_user_id);
    expense.currency = j.value("currency", std::string("USD"));
    j.at("amount").get_to(expense.amount);
    expense.category_id = j.value("category_id", std::optional<std::string>());
    expense.participants = j.value("participants", std::vector<ParticipantWeight>());

    switch (j.value("split_type", SplitType::EQUAL)) {
        case SplitType::EQUAL:
            expense.split = EqualSplit{};
            break;
        case SplitType::WEIGHTED:
            expense.split = WeightedSplit{};
            break;
        case SplitType::ITEMIZED: {
            ItemizedSplit itemized;
            itemized.participant_amounts = j.value("participant_amounts", std::map<std::string, Decimal>());
            itemized.items = j.value("items", std::vector<LineItem>());
            itemized.extras = j.value("extras", Extras());
            itemized.allocation = j.value("allocation", std::optional<AllocationRule>());
            expense.split = std::move(itemized);
            break;
        }
    }
}

Decimal PersonCategorySpending::total_category_spending() const {
    Decimal total;
    for (const auto& category : category_breakdown) {
        total += category.amount;
    }
    return total;
}

Decimal PersonCategorySpending::spending_for_category(const std::string& category_id) const {
    auto it = std::find_if(category_breakdown.begin(), category_breakdown.end(),
                           [&](const CategorySpending& c) { return c.category_id == category_id; });
    return it == category_breakdown.end() ? Decimal() : it->amount;
}
