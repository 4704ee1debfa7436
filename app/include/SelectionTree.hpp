#ifndef SELECTION_TREE_HPP
#define SELECTION_TREE_HPP

#include "MediaTypes.hpp"
#include <QString>
#include <memory>
#include <optional>
#include <vector>

enum class SelectionKind {
    Root,
    Category,
    Show,
    Season,
    File
};

enum class SelectionState {
    Checked,
    Unchecked,
    Partial   // never held by a File node
};

struct SelectionNode {
    SelectionKind kind;
    SelectionState state;
    QString label;
    SelectionNode* parent;
    std::vector<std::unique_ptr<SelectionNode>> children;

    // File nodes only
    std::optional<MediaItem> item;
    int plan_index;

    SelectionNode() : kind(SelectionKind::Root), state(SelectionState::Checked),
                      parent(nullptr), plan_index(-1) {}

    bool is_file() const { return kind == SelectionKind::File; }
};

// Category -> Show -> Season -> File grouping of a plan with tri-state
// selection. Holds selection truth; views only read it and call toggle().
class SelectionTree {
public:
    SelectionTree();

    // Replaces any previous tree. All leaves start Checked.
    void build(const MediaItemList& items);
    void clear();

    SelectionNode* root_node() const { return root_.get(); }
    bool is_empty() const { return root_->children.empty(); }

    // No explicit state flips Checked <-> Unchecked; Partial becomes Checked.
    // Applies to node and all descendants, then re-aggregates every ancestor.
    void toggle(SelectionNode* node, std::optional<bool> checked = std::nullopt);

    // Checked leaves in the order they were given to build().
    MediaItemList selected_items() const;
    int selected_count() const;
    bool has_selection() const;

    SelectionNode* find_file_node(const QString& source_path) const;

private:
    static void set_subtree(SelectionNode* node, SelectionState state);
    static SelectionState aggregate(const SelectionNode* node);
    static void collect_checked(const SelectionNode* node, std::vector<const SelectionNode*>& out);

    SelectionNode* add_child(SelectionNode* parent, SelectionKind kind, const QString& label);
    void add_leaf(SelectionNode* parent, const MediaItem& item, int plan_index);

    std::unique_ptr<SelectionNode> root_;
};

#endif // SELECTION_TREE_HPP
