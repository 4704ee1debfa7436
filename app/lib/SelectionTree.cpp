#include "SelectionTree.hpp"
#include "AppLogger.hpp"
#include <algorithm>
#include <map>

namespace {

struct CaseInsensitiveLess {
    bool operator()(const QString& a, const QString& b) const {
        const int cmp = QString::compare(a, b, Qt::CaseInsensitive);
        return cmp != 0 ? cmp < 0 : a < b;
    }
};

// Indices into the plan, ordered by destination file name.
void sort_by_dest_name(std::vector<int>& indices, const MediaItemList& items) {
    std::stable_sort(indices.begin(), indices.end(), [&items](int a, int b) {
        return CaseInsensitiveLess()(items[a].dest_file_name, items[b].dest_file_name);
    });
}

} // namespace

SelectionTree::SelectionTree()
    : root_(std::make_unique<SelectionNode>()) {
}

void SelectionTree::clear() {
    root_ = std::make_unique<SelectionNode>();
}

SelectionNode* SelectionTree::add_child(SelectionNode* parent, SelectionKind kind, const QString& label) {
    auto child = std::make_unique<SelectionNode>();
    child->kind = kind;
    child->label = label;
    child->parent = parent;
    SelectionNode* raw = child.get();
    parent->children.push_back(std::move(child));
    return raw;
}

void SelectionTree::add_leaf(SelectionNode* parent, const MediaItem& item, int plan_index) {
    SelectionNode* leaf = add_child(parent, SelectionKind::File, item.dest_file_name);
    leaf->item = item;
    leaf->plan_index = plan_index;
}

void SelectionTree::build(const MediaItemList& items) {
    clear();

    std::vector<int> movies;
    // show -> season -> plan indices
    std::map<QString, std::map<int, std::vector<int>>, CaseInsensitiveLess> shows;
    int series_count = 0;

    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        const MediaItem& item = items[i];
        if (item.content_type == ContentType::Series) {
            shows[item.show_title][item.season.value_or(1)].push_back(i);
            ++series_count;
        } else {
            movies.push_back(i);
        }
    }

    if (!movies.empty()) {
        sort_by_dest_name(movies, items);
        SelectionNode* category = add_child(root_.get(), SelectionKind::Category,
            QString("Movies (%1)").arg(movies.size()));
        for (int index : movies) {
            add_leaf(category, items[index], index);
        }
    }

    if (!shows.empty()) {
        SelectionNode* category = add_child(root_.get(), SelectionKind::Category,
            QString("Series (%1 files)").arg(series_count));
        for (auto& [show, seasons] : shows) {
            SelectionNode* show_node = add_child(category, SelectionKind::Show, show);
            for (auto& [season, indices] : seasons) {
                SelectionNode* season_node = add_child(show_node, SelectionKind::Season,
                    QString("Season %1").arg(season, 2, 10, QChar('0')));
                sort_by_dest_name(indices, items);
                for (int index : indices) {
                    add_leaf(season_node, items[index], index);
                }
            }
        }
    }

    LOG_DEBUG("SelectionTree", QString("Built tree: %1 movie(s), %2 show(s), %3 episode(s)")
              .arg(movies.size()).arg(shows.size()).arg(series_count));
}

void SelectionTree::set_subtree(SelectionNode* node, SelectionState state) {
    node->state = state;
    for (auto& child : node->children) {
        set_subtree(child.get(), state);
    }
}

SelectionState SelectionTree::aggregate(const SelectionNode* node) {
    if (node->children.empty()) {
        return node->state;
    }
    bool any_checked = false;
    bool any_unchecked = false;
    for (const auto& child : node->children) {
        switch (child->state) {
            case SelectionState::Checked:   any_checked = true; break;
            case SelectionState::Unchecked: any_unchecked = true; break;
            case SelectionState::Partial:   return SelectionState::Partial;
        }
        if (any_checked && any_unchecked) {
            return SelectionState::Partial;
        }
    }
    return any_checked ? SelectionState::Checked : SelectionState::Unchecked;
}

void SelectionTree::toggle(SelectionNode* node, std::optional<bool> checked) {
    if (!node) {
        return;
    }

    bool target;
    if (checked) {
        target = *checked;
    } else {
        target = node->state != SelectionState::Checked;
    }

    set_subtree(node, target ? SelectionState::Checked : SelectionState::Unchecked);

    for (SelectionNode* ancestor = node->parent; ancestor; ancestor = ancestor->parent) {
        ancestor->state = aggregate(ancestor);
    }
}

void SelectionTree::collect_checked(const SelectionNode* node, std::vector<const SelectionNode*>& out) {
    if (node->is_file()) {
        if (node->state == SelectionState::Checked) {
            out.push_back(node);
        }
        return;
    }
    for (const auto& child : node->children) {
        collect_checked(child.get(), out);
    }
}

MediaItemList SelectionTree::selected_items() const {
    std::vector<const SelectionNode*> leaves;
    collect_checked(root_.get(), leaves);

    std::sort(leaves.begin(), leaves.end(), [](const SelectionNode* a, const SelectionNode* b) {
        return a->plan_index < b->plan_index;
    });

    MediaItemList result;
    result.reserve(leaves.size());
    for (const SelectionNode* leaf : leaves) {
        result.push_back(*leaf->item);
    }
    return result;
}

int SelectionTree::selected_count() const {
    std::vector<const SelectionNode*> leaves;
    collect_checked(root_.get(), leaves);
    return static_cast<int>(leaves.size());
}

bool SelectionTree::has_selection() const {
    return selected_count() > 0;
}

SelectionNode* SelectionTree::find_file_node(const QString& source_path) const {
    std::vector<SelectionNode*> stack{root_.get()};
    while (!stack.empty()) {
        SelectionNode* node = stack.back();
        stack.pop_back();
        if (node->is_file() && node->item && node->item->source_path == source_path) {
            return node;
        }
        for (auto& child : node->children) {
            stack.push_back(child.get());
        }
    }
    return nullptr;
}
