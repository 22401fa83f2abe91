#pragma once

#include <QWidget>

class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class QShortcut;

namespace tasklist {
namespace ui {

class TaskInlineEditor : public QWidget
{
    Q_OBJECT

public:
    explicit TaskInlineEditor(QWidget *parent = nullptr);

    void setTask(const QString &title, const QString &description);
    void focusTitle(bool selectAll = false);
    void clearEditor();

signals:
    void titleEdited(const QString &title);
    void descriptionEdited(const QString &description);
    void saveRequested();
    void cancelRequested();

private:
    QLineEdit *m_titleEdit = nullptr;
    QPlainTextEdit *m_descriptionEdit = nullptr;
    QPushButton *m_saveButton = nullptr;
    QPushButton *m_cancelButton = nullptr;
    QShortcut *m_saveShortcut = nullptr;
    QShortcut *m_escapeShortcut = nullptr;
};

} // namespace ui
} // namespace tasklist
