#include "McpIDE/editor/qt/mi_dialogs.hpp"
#include "mi_dialogs_detail.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

namespace McpIDE::editor::qt {

MIInputDialog::MIInputDialog(QWidget *parent, const QString &title, const QString &label,
                             const QString &text, Validator validator)
    : QDialog(parent) {
  detail::prepareDialog(this, "MIInputDialog", title);

  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(detail::DIALOG_MARGIN, detail::DIALOG_MARGIN, detail::DIALOG_MARGIN,
                             detail::DIALOG_MARGIN);
  layout->setSpacing(6);

  auto *prompt = new QLabel(label, this);
  prompt->setWordWrap(true);
  layout->addWidget(prompt);

  m_textEdit = new QLineEdit(text, this);
  prompt->setBuddy(m_textEdit);
  layout->addWidget(m_textEdit);

  m_errorLabel = new QLabel(this);
  m_errorLabel->setObjectName("MIDialogError");
  m_errorLabel->setWordWrap(true);
  layout->addWidget(m_errorLabel);

  layout->addLayout(detail::createAcceptRejectRow(this, &m_okButton, &m_cancelButton));

  detail::bindValidation(m_textEdit, m_errorLabel, m_okButton, std::move(validator));

  // Select the stem so typing replaces the name but keeps the extension
  const int dot = text.lastIndexOf('.');
  m_textEdit->setSelection(0, dot > 0 ? dot : text.size());
  m_textEdit->setFocus();

  detail::animateDialogIn(this);
}

QString MIInputDialog::getText(QWidget *parent, const QString &title, const QString &label,
                               const QString &text, bool *ok, Validator validator) {
  MIInputDialog dialog(parent, title, label, text, std::move(validator));
  const bool accepted = dialog.exec() == QDialog::Accepted;
  if (ok) {
    *ok = accepted;
  }
  return accepted ? dialog.m_textEdit->text() : QString();
}

} // namespace McpIDE::editor::qt
