#pragma once

#include <QString>
#include <optional>
#include <vector>

namespace keeper {
namespace data {

struct Category
{
    QString id;
    QString name;
    QString color;
    int todoCount = 0;
};

bool operator==(const Category &lhs, const Category &rhs);
bool operator!=(const Category &lhs, const Category &rhs);

struct CategoryInput
{
    QString name;
    QString color;
};

struct CategoryUpdate
{
    std::optional<QString> name;
    std::optional<QString> color;
};

Category createCategory(CategoryInput input);
QString normalizeColor(const QString &color);
std::vector<CategoryInput> defaultCategories();

} // namespace data
} // namespace keeper
