#include "SelectionTreeModel.hpp"
#include "NameUtils.hpp"
#include <QIcon>

SelectionTreeModel::SelectionTreeModel(SelectionTree& tree, QObject* parent)
    : QAbstractItemModel(parent)
    , tree_(tree) {
}

SelectionTreeModel::~SelectionTreeModel() = default;

SelectionNode* SelectionTreeModel::node_at(const QModelIndex& index) const {
    if (!index.isValid()) {
        return tree_.root_node();
    }
    return static_cast<SelectionNode*>(index.internalPointer());
}

QModelIndex SelectionTreeModel::index(int row, int column, const QModelIndex& parent) const {
    if (!hasIndex(row, column, parent)) {
        return QModelIndex();
    }

    SelectionNode* parent_node = node_at(parent);
    if (row >= 0 && row < static_cast<int>(parent_node->children.size())) {
        return createIndex(row, column, parent_node->children[row].get());
    }

    return QModelIndex();
}

QModelIndex SelectionTreeModel::parent(const QModelIndex& index) const {
    if (!index.isValid()) {
        return QModelIndex();
    }

    SelectionNode* node = static_cast<SelectionNode*>(index.internalPointer());
    SelectionNode* parent_node = node->parent;
    if (!parent_node || parent_node == tree_.root_node()) {
        return QModelIndex();
    }
    return index_for_node(parent_node);
}

QModelIndex SelectionTreeModel::index_for_node(SelectionNode* node) const {
    if (!node || node == tree_.root_node() || !node->parent) {
        return QModelIndex();
    }

    // Find row of node in its parent
    const auto& siblings = node->parent->children;
    for (size_t i = 0; i < siblings.size(); ++i) {
        if (siblings[i].get() == node) {
            return createIndex(static_cast<int>(i), 0, node);
        }
    }
    return QModelIndex();
}

int SelectionTreeModel::rowCount(const QModelIndex& parent) const {
    if (parent.column() > 0) {
        return 0;
    }
    return static_cast<int>(node_at(parent)->children.size());
}

int SelectionTreeModel::columnCount(const QModelIndex&) const {
    return 1;
}

QVariant SelectionTreeModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid()) {
        return QVariant();
    }

    const SelectionNode* node = static_cast<SelectionNode*>(index.internalPointer());

    switch (role) {
        case Qt::DisplayRole:
            return node->label;
        case Qt::CheckStateRole:
            switch (node->state) {
                case SelectionState::Checked:   return Qt::Checked;
                case SelectionState::Unchecked: return Qt::Unchecked;
                case SelectionState::Partial:   return Qt::PartiallyChecked;
            }
            break;
        case Qt::ToolTipRole:
            if (node->item) {
                return QString("%1\n-> %2\n%3")
                    .arg(node->item->source_path, node->item->dest_path,
                         naming::format_bytes(node->item->source_size));
            }
            return node->label;
        case Qt::DecorationRole:
            if (node->kind == SelectionKind::File) {
                return QIcon::fromTheme("video-x-generic");
            }
            return QIcon::fromTheme("folder");
        case SourcePathRole:
            return node->item ? node->item->source_path : QString();
        case DestPathRole:
            return node->item ? node->item->dest_path : QString();
        case KindRole:
            return static_cast<int>(node->kind);
        case SizeRole:
            return node->item ? node->item->source_size : qint64(0);
    }

    return QVariant();
}

bool SelectionTreeModel::setData(const QModelIndex& index, const QVariant& value, int role) {
    if (!index.isValid() || role != Qt::CheckStateRole) {
        return false;
    }

    SelectionNode* node = static_cast<SelectionNode*>(index.internalPointer());
    const auto requested = static_cast<Qt::CheckState>(value.toInt());

    // A tristate view cycles through PartiallyChecked; treat it as a plain flip.
    if (requested == Qt::PartiallyChecked) {
        tree_.toggle(node);
    } else {
        tree_.toggle(node, requested == Qt::Checked);
    }

    emit_subtree_changed(node);
    for (SelectionNode* ancestor = node->parent;
         ancestor && ancestor != tree_.root_node();
         ancestor = ancestor->parent) {
        const QModelIndex idx = index_for_node(ancestor);
        emit dataChanged(idx, idx, {Qt::CheckStateRole});
    }

    emit selection_changed(tree_.selected_count());
    return true;
}

void SelectionTreeModel::emit_subtree_changed(SelectionNode* node) {
    const QModelIndex idx = index_for_node(node);
    emit dataChanged(idx, idx, {Qt::CheckStateRole});
    if (!node->children.empty()) {
        const QModelIndex first = index(0, 0, idx);
        const QModelIndex last = index(static_cast<int>(node->children.size()) - 1, 0, idx);
        emit dataChanged(first, last, {Qt::CheckStateRole});
        for (auto& child : node->children) {
            if (!child->children.empty()) {
                emit_subtree_changed(child.get());
            }
        }
    }
}

Qt::ItemFlags SelectionTreeModel::flags(const QModelIndex& index) const {
    if (!index.isValid()) {
        return Qt::NoItemFlags;
    }
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsUserCheckable;
}

QVariant SelectionTreeModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (section == 0 && orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        return tr("Planned destination");
    }
    return QVariant();
}

QHash<int, QByteArray> SelectionTreeModel::roleNames() const {
    QHash<int, QByteArray> roles = QAbstractItemModel::roleNames();
    roles[SourcePathRole] = "sourcePath";
    roles[DestPathRole] = "destPath";
    roles[KindRole] = "kind";
    roles[SizeRole] = "size";
    return roles;
}

void SelectionTreeModel::set_items(const MediaItemList& items) {
    beginResetModel();
    tree_.build(items);
    endResetModel();
    emit selection_changed(tree_.selected_count());
}

void SelectionTreeModel::clear() {
    beginResetModel();
    tree_.clear();
    endResetModel();
    emit selection_changed(0);
}
