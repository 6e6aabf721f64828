#include "keeper/data/Validation.hpp"

#include <QRegularExpression>
#include <algorithm>

namespace keeper {
namespace data {

namespace {
const QStringList &reservedNames()
{
    static const QStringList names = {
        QStringLiteral("all"),
        QStringLiteral("completed"),
        QStringLiteral("pending"),
        QStringLiteral("overdue"),
    };
    return names;
}
} // namespace

void ValidationReport::add(const ValidationResult &result)
{
    if (!result.valid) {
        errors << result.error;
    }
}

ValidationResult validateTitle(const QString &title)
{
    if (title.trimmed().isEmpty()) {
        return ValidationResult::fail(QStringLiteral("Title cannot be empty"));
    }
    if (title.size() > MaxTitleLength) {
        return ValidationResult::fail(
            QStringLiteral("Title cannot exceed %1 characters").arg(MaxTitleLength));
    }
    return ValidationResult::ok();
}

ValidationResult validateDescription(const QString &description)
{
    if (description.size() > MaxDescriptionLength) {
        return ValidationResult::fail(
            QStringLiteral("Description cannot exceed %1 characters").arg(MaxDescriptionLength));
    }
    return ValidationResult::ok();
}

ValidationResult validatePriority(Priority priority)
{
    switch (priority) {
    case Priority::Low:
    case Priority::Medium:
    case Priority::High:
        return ValidationResult::ok();
    }
    return ValidationResult::fail(QStringLiteral("Priority must be one of: low, medium, high"));
}

ValidationResult validateCategoryId(const QString &categoryId)
{
    if (categoryId.trimmed().isEmpty()) {
        return ValidationResult::fail(QStringLiteral("Category ID cannot be empty"));
    }
    return ValidationResult::ok();
}

ValidationResult validateDueDate(const std::optional<QDateTime> &dueDate)
{
    if (!dueDate.has_value()) {
        return ValidationResult::ok();
    }
    if (!dueDate->isValid()) {
        return ValidationResult::fail(QStringLiteral("Due date must be a valid date"));
    }
    return ValidationResult::ok();
}

ValidationReport validateTodoInput(const TodoInput &input)
{
    ValidationReport report;
    report.add(validateTitle(input.title));
    report.add(validateDescription(input.description));
    report.add(validatePriority(input.priority));
    report.add(validateCategoryId(input.categoryId));
    report.add(validateDueDate(input.dueDate));
    return report;
}

ValidationResult validateCategoryName(const QString &name)
{
    if (name.trimmed().isEmpty()) {
        return ValidationResult::fail(QStringLiteral("Category name cannot be empty"));
    }
    if (name.size() > MaxCategoryNameLength) {
        return ValidationResult::fail(
            QStringLiteral("Category name cannot exceed %1 characters").arg(MaxCategoryNameLength));
    }
    if (isReservedCategoryName(name)) {
        return ValidationResult::fail(QStringLiteral("\"%1\" is a reserved category name").arg(name));
    }
    return ValidationResult::ok();
}

ValidationResult validateCategoryColor(const QString &color)
{
    static const QRegularExpression hexColor(QStringLiteral("^#?([A-Fa-f0-9]{6}|[A-Fa-f0-9]{3})$"));
    if (!hexColor.match(color).hasMatch()) {
        return ValidationResult::fail(
            QStringLiteral("Color must be a valid hex color code (e.g., #FF0000 or #F00)"));
    }
    return ValidationResult::ok();
}

ValidationReport validateCategoryInput(const CategoryInput &input)
{
    ValidationReport report;
    report.add(validateCategoryName(input.name));
    report.add(validateCategoryColor(input.color));
    return report;
}

bool isReservedCategoryName(const QString &name)
{
    return reservedNames().contains(name.trimmed(), Qt::CaseInsensitive);
}

bool isCategoryNameUnique(const QString &name,
                          const std::vector<Category> &candidates,
                          const QString &excludeId)
{
    return std::none_of(candidates.cbegin(), candidates.cend(), [&](const Category &category) {
        if (!excludeId.isEmpty() && category.id == excludeId) {
            return false;
        }
        return category.name.compare(name, Qt::CaseInsensitive) == 0;
    });
}

} // namespace data
} // namespace keeper
