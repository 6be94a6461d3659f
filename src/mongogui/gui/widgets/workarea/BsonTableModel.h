#pragma once

#include <vector>

#include <QAbstractTableModel>

#include "mongogui/core/Core.h"

namespace MongoGui
{
    /**
     * @brief Table over one page of documents. Columns are the union of
     *        top-level keys in order of first appearance, rows keep the
     *        order of documents.
     */
    class BsonTableModel : public QAbstractTableModel
    {
        Q_OBJECT

    public:
        typedef QAbstractTableModel BaseClass;
        typedef std::vector<QString> ColumnsValuesType;

        explicit BsonTableModel(QObject *parent = 0);

        void setDocuments(const std::vector<MongoDocumentPtr> &documents, long long firstRowNumber);
        MongoDocumentPtr document(int row) const;
        const ColumnsValuesType &columns() const { return _columns; }

        int rowCount(const QModelIndex &parent = QModelIndex()) const;
        int columnCount(const QModelIndex &parent = QModelIndex()) const;
        QVariant data(const QModelIndex &index, int role) const;
        QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const;

    private:
        size_t addColumn(const QString &col);
        size_t findIndexColumn(const QString &col) const;

        ColumnsValuesType _columns;
        std::vector<MongoDocumentPtr> _documents;
        long long _firstRowNumber;
    };
}
