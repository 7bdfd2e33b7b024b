#ifndef SELECTIONSTORE_H
#define SELECTIONSTORE_H

#include <QString>

// At most one image and one text layer are selected at a time.
class SelectionStore {
public:
    QString selectedImageId() const;
    void setSelectedImageId(const QString& imageId);

    QString selectedTextId() const;
    void setSelectedTextId(const QString& textId);

    bool isEmpty() const;
    void clear();

private:
    QString m_selectedImageId;
    QString m_selectedTextId;
};

#endif // SELECTIONSTORE_H
