#include "gridcalc/core/Workbook.hpp"
#include "gridcalc/utils/CommonUtils.hpp"
#include "gridcalc/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace gridcalc {
namespace core {

Workbook::Workbook(CalcOptions options)
    : options_(std::move(options)) {
    sheets_.push_back(std::make_unique<Sheet>(generateSheetName(), options_));
}

size_t Workbook::addSheet(const std::string& name) {
    std::string final_name = name.empty() ? generateSheetName() : makeUniqueName(name);
    sheets_.push_back(std::make_unique<Sheet>(final_name, options_));
    CORE_DEBUG("Added sheet '{}' at index {}", final_name, sheets_.size() - 1);
    return sheets_.size() - 1;
}

std::unique_ptr<Sheet> Workbook::removeSheet(size_t index) {
    if (index >= sheets_.size()) {
        CORE_WARN("Cannot remove sheet: index {} out of range", index);
        return nullptr;
    }
    if (sheets_.size() == 1) {
        CORE_WARN("Cannot remove the last sheet '{}'", sheets_[0]->getName());
        return nullptr;
    }

    std::unique_ptr<Sheet> removed = std::move(sheets_[index]);
    sheets_.erase(sheets_.begin() + static_cast<std::ptrdiff_t>(index));

    if (active_sheet_ >= sheets_.size()) {
        active_sheet_ = sheets_.size() - 1;
    }

    CORE_DEBUG("Removed sheet '{}', active index is now {}", removed->getName(), active_sheet_);
    return removed;
}

bool Workbook::renameSheet(size_t index, const std::string& new_name) {
    if (index >= sheets_.size() || new_name.empty()) {
        return false;
    }
    if (isNameTaken(new_name, index)) {
        CORE_WARN("Cannot rename sheet to '{}': name already in use", new_name);
        return false;
    }

    std::string old_name = sheets_[index]->getName();
    sheets_[index]->setName(new_name);
    CORE_DEBUG("Renamed sheet '{}' to '{}'", old_name, new_name);
    return true;
}

Sheet* Workbook::getSheet(size_t index) {
    return index < sheets_.size() ? sheets_[index].get() : nullptr;
}

const Sheet* Workbook::getSheet(size_t index) const {
    return index < sheets_.size() ? sheets_[index].get() : nullptr;
}

std::optional<size_t> Workbook::findSheet(std::string_view name) const {
    for (size_t i = 0; i < sheets_.size(); ++i) {
        if (utils::CommonUtils::equalsIgnoreCase(sheets_[i]->getName(), name)) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<std::string> Workbook::getSheetNames() const {
    std::vector<std::string> names;
    names.reserve(sheets_.size());
    for (const auto& sheet : sheets_) {
        names.push_back(sheet->getName());
    }
    return names;
}

bool Workbook::setActiveSheet(size_t index) {
    if (index >= sheets_.size()) {
        return false;
    }
    active_sheet_ = index;
    return true;
}

void Workbook::setOptions(const CalcOptions& options) {
    options_ = options;
    for (auto& sheet : sheets_) {
        sheet->setOptions(options);
    }
}

std::string Workbook::generateSheetName() const {
    for (size_t n = 1;; ++n) {
        std::string candidate = fmt::format("{}{}", options_.default_sheet_name_prefix, n);
        if (!isNameTaken(candidate)) {
            return candidate;
        }
    }
}

std::string Workbook::makeUniqueName(const std::string& base) const {
    if (!isNameTaken(base)) {
        return base;
    }
    for (size_t n = 2;; ++n) {
        std::string candidate = fmt::format("{} ({})", base, n);
        if (!isNameTaken(candidate)) {
            return candidate;
        }
    }
}

bool Workbook::isNameTaken(std::string_view name, size_t ignore_index) const {
    for (size_t i = 0; i < sheets_.size(); ++i) {
        if (i != ignore_index && utils::CommonUtils::equalsIgnoreCase(sheets_[i]->getName(), name)) {
            return true;
        }
    }
    return false;
}

}} // namespace gridcalc::core
