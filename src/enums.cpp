#include "stockledger/enums.hpp"
#include <map>

namespace stockledger {

std::string display_name(v1::MovementType type) {
    static const std::map<v1::MovementType, std::string> names = {
        {v1::MovementType::PURCHASE, "Purchase"},
        {v1::MovementType::SALE, "Sale"},
        {v1::MovementType::ADJUSTMENT, "Adjustment"},
        {v1::MovementType::TRANSFER, "Transfer"},
        {v1::MovementType::RETURN, "Return"},
        {v1::MovementType::DAMAGE, "Damage"},
        {v1::MovementType::SHRINKAGE, "Shrinkage"},
        {v1::MovementType::INITIAL, "Initial Stock"},
        {v1::MovementType::RECOUNT, "Recount"},
        {v1::MovementType::RELEASE, "Release"},
        {v1::MovementType::RESERVATION, "Reservation"},
    };
    auto it = names.find(type);
    return it != names.end() ? it->second : "Unknown";
}

std::string display_name(v1::CostingMethod method) {
    static const std::map<v1::CostingMethod, std::string> names = {
        {v1::CostingMethod::FIFO, "First In, First Out"},
        {v1::CostingMethod::LIFO, "Last In, First Out"},
        {v1::CostingMethod::WEIGHTED_AVERAGE, "Weighted Average"},
        {v1::CostingMethod::SPECIFIC_IDENTIFICATION, "Specific Identification"},
        {v1::CostingMethod::STANDARD_COST, "Standard Cost"},
    };
    auto it = names.find(method);
    return it != names.end() ? it->second : "Unknown";
}

std::string display_name(v1::StockStatus status) {
    switch (status) {
        case v1::StockStatus::IN_STOCK: return "In Stock";
        case v1::StockStatus::LOW_STOCK: return "Low Stock";
        case v1::StockStatus::OUT_OF_STOCK: return "Out of Stock";
        case v1::StockStatus::NOT_TRACKED: return "Not Tracked";
        default: return "Unknown";
    }
}

std::string display_name(v1::ReorderPriority priority) {
    switch (priority) {
        case v1::ReorderPriority::PRIORITY_HIGH: return "high";
        case v1::ReorderPriority::PRIORITY_NORMAL: return "normal";
        default: return "unknown";
    }
}

bool is_reversible(v1::MovementType type) {
    switch (type) {
        case v1::MovementType::PURCHASE:
        case v1::MovementType::SALE:
        case v1::MovementType::ADJUSTMENT:
        case v1::MovementType::RETURN:
        case v1::MovementType::DAMAGE:
        case v1::MovementType::SHRINKAGE:
        case v1::MovementType::RECOUNT:
            return true;
        default:
            return false;
    }
}

} // namespace stockledger
