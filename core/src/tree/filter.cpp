#include "reqnav/tree.h"

#include "util/string_util.h"

namespace reqnav {

namespace {

bool item_matches(const TreeItem& item, const std::string& needle_lower) {
  if (util::contains_lowered(item.name, needle_lower)) return true;
  switch (item.kind) {
    case TreeItemKind::Request:
      return util::contains_lowered(item.method, needle_lower);
    case TreeItemKind::Collection:
    case TreeItemKind::Folder:
    case TreeItemKind::Socket:
      return false;
  }
  return false;
}

}  // namespace

std::vector<TreeItem> filter_tree_items(const std::vector<TreeItem>& items,
                                        const std::string& query) {
  if (query.empty()) return items;
  const std::string needle = util::to_lower(query);
  std::vector<TreeItem> out;
  for (const auto& item : items) {
    if (item_matches(item, needle)) out.push_back(item);
  }
  return out;
}

}  // namespace reqnav
