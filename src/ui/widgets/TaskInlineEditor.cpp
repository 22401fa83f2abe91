#include "tasklist/ui/widgets/TaskInlineEditor.hpp"

#include <QFormLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QShortcut>
#include <QSignalBlocker>
#include <QVBoxLayout>

namespace tasklist {
namespace ui {

TaskInlineEditor::TaskInlineEditor(QWidget *parent)
    : QWidget(parent)
{
    setVisible(false);
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(6);

    auto *formLayout = new QFormLayout();
    formLayout->setSpacing(6);

    m_titleEdit = new QLineEdit(this);
    m_titleEdit->setPlaceholderText(tr("Title"));
    formLayout->addRow(tr("Title"), m_titleEdit);
    connect(m_titleEdit, &QLineEdit::textChanged, this, &TaskInlineEditor::titleEdited);
    connect(m_titleEdit, &QLineEdit::returnPressed, this, &TaskInlineEditor::saveRequested);

    m_descriptionEdit = new QPlainTextEdit(this);
    m_descriptionEdit->setPlaceholderText(tr("Description (optional)"));
    m_descriptionEdit->setTabChangesFocus(true);
    formLayout->addRow(tr("Description"), m_descriptionEdit);
    connect(m_descriptionEdit, &QPlainTextEdit::textChanged, this, [this]() {
        emit descriptionEdited(m_descriptionEdit->toPlainText());
    });

    layout->addLayout(formLayout);

    auto *buttonLayout = new QHBoxLayout();
    buttonLayout->addStretch();
    m_cancelButton = new QPushButton(tr("Cancel"), this);
    m_saveButton = new QPushButton(tr("Save"), this);
    m_saveButton->setDefault(true);
    buttonLayout->addWidget(m_cancelButton);
    buttonLayout->addWidget(m_saveButton);
    layout->addLayout(buttonLayout);

    connect(m_saveButton, &QPushButton::clicked, this, &TaskInlineEditor::saveRequested);
    connect(m_cancelButton, &QPushButton::clicked, this, &TaskInlineEditor::cancelRequested);

    m_saveShortcut = new QShortcut(QKeySequence(Qt::ALT | Qt::Key_Return), this);
    m_saveShortcut->setContext(Qt::WidgetWithChildrenShortcut);
    connect(m_saveShortcut, &QShortcut::activated, this, &TaskInlineEditor::saveRequested);

    m_escapeShortcut = new QShortcut(QKeySequence(Qt::Key_Escape), this);
    m_escapeShortcut->setContext(Qt::WidgetWithChildrenShortcut);
    connect(m_escapeShortcut, &QShortcut::activated, this, &TaskInlineEditor::cancelRequested);
}

void TaskInlineEditor::setTask(const QString &title, const QString &description)
{
    const QSignalBlocker titleBlocker(m_titleEdit);
    const QSignalBlocker descriptionBlocker(m_descriptionEdit);
    m_titleEdit->setText(title);
    m_descriptionEdit->setPlainText(description);
    setVisible(true);
}

void TaskInlineEditor::focusTitle(bool selectAll)
{
    m_titleEdit->setFocus(Qt::OtherFocusReason);
    if (selectAll) {
        m_titleEdit->selectAll();
    }
}

void TaskInlineEditor::clearEditor()
{
    const QSignalBlocker titleBlocker(m_titleEdit);
    const QSignalBlocker descriptionBlocker(m_descriptionEdit);
    m_titleEdit->clear();
    m_descriptionEdit->clear();
    setVisible(false);
}

} // namespace ui
} // namespace tasklist
