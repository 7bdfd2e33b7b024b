#include "backend/domain/scene/SelectionStore.h"

QString SelectionStore::selectedImageId() const {
    return m_selectedImageId;
}

void SelectionStore::setSelectedImageId(const QString& imageId) {
    m_selectedImageId = imageId;
}

QString SelectionStore::selectedTextId() const {
    return m_selectedTextId;
}

void SelectionStore::setSelectedTextId(const QString& textId) {
    m_selectedTextId = textId;
}

bool SelectionStore::isEmpty() const {
    return m_selectedImageId.isEmpty() && m_selectedTextId.isEmpty();
}

void SelectionStore::clear() {
    m_selectedImageId.clear();
    m_selectedTextId.clear();
}
