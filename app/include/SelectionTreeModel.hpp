#ifndef SELECTION_TREE_MODEL_HPP
#define SELECTION_TREE_MODEL_HPP

#include "SelectionTree.hpp"
#include <QAbstractItemModel>

// Item-model view of a SelectionTree. Check state edits are routed to
// SelectionTree::toggle; the tree stays the owner of the selection.
class SelectionTreeModel : public QAbstractItemModel {
    Q_OBJECT

public:
    enum Roles {
        SourcePathRole = Qt::UserRole + 1,
        DestPathRole,
        KindRole,
        SizeRole
    };

    explicit SelectionTreeModel(SelectionTree& tree, QObject* parent = nullptr);
    ~SelectionTreeModel() override;

    // QAbstractItemModel interface
    QModelIndex index(int row, int column, const QModelIndex& parent = QModelIndex()) const override;
    QModelIndex parent(const QModelIndex& index) const override;
    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    bool setData(const QModelIndex& index, const QVariant& value, int role = Qt::EditRole) override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    // Rebuilds from a new plan, or empties the view.
    void set_items(const MediaItemList& items);
    void clear();

    SelectionNode* node_at(const QModelIndex& index) const;
    QModelIndex index_for_node(SelectionNode* node) const;

signals:
    void selection_changed(int selected_count);

private:
    void emit_subtree_changed(SelectionNode* node);

    SelectionTree& tree_;
};

#endif // SELECTION_TREE_MODEL_HPP
