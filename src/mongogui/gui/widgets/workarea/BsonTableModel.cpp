#include "mongogui/gui/widgets/workarea/BsonTableModel.h"

#include <QBrush>

#include <mongo/bson/bsonobjiterator.h>

#include "mongogui/core/domain/MongoDocument.h"
#include "mongogui/core/utils/QtUtils.h"

namespace
{
    QString elementText(const mongo::BSONElement &element)
    {
        switch (element.type()) {
        case mongo::String:
        case mongo::Code:
        case mongo::Symbol:
            return MongoGui::QtUtils::toQString(element.str());
        case mongo::Object:
        case mongo::Array:
            return MongoGui::QtUtils::toQString(element.embeddedObject().jsonString(mongo::Strict, 0,
                                                                                  element.type() == mongo::Array));
        default:
            return MongoGui::QtUtils::toQString(element.toString(false));
        }
    }
}

namespace MongoGui
{
    BsonTableModel::BsonTableModel(QObject *parent)
        : BaseClass(parent), _firstRowNumber(1)
    {
    }

    void BsonTableModel::setDocuments(const std::vector<MongoDocumentPtr> &documents, long long firstRowNumber)
    {
        beginResetModel();
        _documents = documents;
        _firstRowNumber = firstRowNumber;
        _columns.clear();
        for (auto const &doc : _documents) {
            mongo::BSONObjIterator it(doc->bsonObj());
            while (it.more()) {
                addColumn(QString::fromUtf8(it.next().fieldName()));
            }
        }
        endResetModel();
    }

    MongoDocumentPtr BsonTableModel::document(int row) const
    {
        if (row < 0 || row >= static_cast<int>(_documents.size()))
            return MongoDocumentPtr();

        return _documents[row];
    }

    int BsonTableModel::rowCount(const QModelIndex &parent) const
    {
        if (parent.isValid())
            return 0;

        return static_cast<int>(_documents.size());
    }

    int BsonTableModel::columnCount(const QModelIndex &parent) const
    {
        if (parent.isValid())
            return 0;

        return static_cast<int>(_columns.size());
    }

    QVariant BsonTableModel::data(const QModelIndex &index, int role) const
    {
        QVariant result;

        if (!index.isValid() || index.row() >= rowCount() || index.column() >= columnCount())
            return result;

        const mongo::BSONObj obj = _documents[index.row()]->bsonObj();
        const std::string key = QtUtils::toStdString(_columns[index.column()]);
        const mongo::BSONElement element = obj.getField(key);

        // Document has no such field
        if (element.eoo()) {
            if (role == Qt::BackgroundRole) {
                return QBrush("#f5f3f2");
            }
            return result;
        }

        if (role == Qt::DisplayRole) {
            result = elementText(element).simplified().left(300);
        }
        else if (role == Qt::ToolTipRole) {
            result = elementText(element).left(500);
        }

        return result;
    }

    QVariant BsonTableModel::headerData(int section, Qt::Orientation orientation, int role) const
    {
        if (role != Qt::DisplayRole)
            return QVariant();

        if (orientation == Qt::Horizontal) {
            if (section < 0 || section >= columnCount())
                return QVariant();
            return _columns[section];
        }

        return QString("%1").arg(_firstRowNumber + section);
    }

    size_t BsonTableModel::findIndexColumn(const QString &col) const
    {
        for (size_t i = 0; i < _columns.size(); ++i) {
            if (_columns[i] == col) {
                return i;
            }
        }
        return _columns.size();
    }

    size_t BsonTableModel::addColumn(const QString &col)
    {
        size_t column = findIndexColumn(col);
        if (column == _columns.size()) {
            _columns.push_back(col);
        }
        return column;
    }
}
