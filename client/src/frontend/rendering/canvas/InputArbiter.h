#ifndef INPUTARBITER_H
#define INPUTARBITER_H

#include <QString>

// Guards which gesture owns the pointer. A gesture can only start from Idle
// and only the gesture that started can end it.
class InputArbiter {
public:
    enum class Mode {
        Idle,
        Drag,
        Resize
    };

    bool isIdle() const;
    Mode mode() const;

    bool beginDrag(const QString& targetId);
    bool beginResize(const QString& imageId);

    bool endDrag(const QString& targetId);
    bool endResize(const QString& imageId);

    QString activeTargetId() const;

    void reset();

private:
    bool begin(Mode requestedMode, const QString& targetId);

    Mode m_mode = Mode::Idle;
    QString m_targetId;
};

#endif // INPUTARBITER_H
