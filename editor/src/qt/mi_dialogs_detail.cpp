/**
 * @file mi_dialogs_detail.cpp
 * @brief Shared construction and styling for the modal dialogs
 */

#include "mi_dialogs_detail.hpp"

#include "McpIDE/editor/qt/mi_style_manager.hpp"

#include <QDialog>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPropertyAnimation>
#include <QPushButton>
#include <QStyle>
#include <QTimer>

namespace McpIDE::editor::qt::detail {

namespace {

QString dialogStyleSheet() {
  const auto &p = MIStyleManager::instance().palette();
  const auto css = [](const QColor &color) { return MIStyleManager::colorToStyleString(color); };

  return QString(R"(
    QDialog { background-color: %1; border: 1px solid %2; }
    QLabel#MIMessageText { color: %3; }
    QLabel#MIMessageIcon { font-size: 22px; font-weight: bold; }
    QLabel#MIDialogError { color: %4; }
    QPushButton#MIPrimaryButton {
      background-color: %5; color: white; border: none; border-radius: 3px;
      padding: 4px 14px; font-weight: 600;
    }
    QPushButton#MIPrimaryButton:disabled { background-color: %6; color: %7; }
    QPushButton#MISecondaryButton {
      background-color: %6; color: %3; border: 1px solid %2; border-radius: 3px;
      padding: 4px 14px;
    }
    QPushButton#MISecondaryButton:hover { border-color: %5; }
    QLineEdit {
      background-color: %8; color: %3; border: 1px solid %2; border-radius: 3px;
      padding: 4px 8px;
    }
    QLineEdit:focus { border-color: %5; }
    QLineEdit[invalid="true"] { border-color: %4; }
  )")
      .arg(css(p.surface), css(p.border), css(p.foreground), css(p.error), css(p.accent),
           css(p.inactiveTab), css(p.textMuted), css(p.background));
}

} // namespace

void prepareDialog(QDialog *dialog, const QString &objectName, const QString &title) {
  dialog->setObjectName(objectName);
  dialog->setWindowTitle(title);
  dialog->setModal(true);
  dialog->setWindowFlag(Qt::WindowContextHelpButtonHint, false);
  dialog->setMinimumWidth(DIALOG_MIN_WIDTH);
  dialog->setStyleSheet(dialogStyleSheet());
}

void animateDialogIn(QDialog *dialog) {
  dialog->setWindowOpacity(0.0);
  QTimer::singleShot(0, dialog, [dialog]() {
    if (!dialog->isVisible()) {
      dialog->setWindowOpacity(1.0);
      return;
    }
    auto *fade = new QPropertyAnimation(dialog, "windowOpacity", dialog);
    fade->setDuration(140);
    fade->setStartValue(0.0);
    fade->setEndValue(1.0);
    fade->start(QAbstractAnimation::DeleteWhenStopped);
  });
}

QPushButton *createDialogButton(const QString &text, bool primary, QWidget *parent) {
  auto *button = new QPushButton(text, parent);
  button->setObjectName(primary ? "MIPrimaryButton" : "MISecondaryButton");
  button->setMinimumSize(DIALOG_BUTTON_MIN_WIDTH, DIALOG_BUTTON_HEIGHT);
  if (primary) {
    button->setDefault(true);
  }
  return button;
}

QHBoxLayout *createAcceptRejectRow(QDialog *dialog, QPushButton **outAccept,
                                   QPushButton **outReject) {
  auto *row = new QHBoxLayout();
  row->setContentsMargins(0, DIALOG_SPACING, 0, 0);
  row->setSpacing(8);
  row->addStretch();

  QPushButton *reject = createDialogButton(QDialog::tr("Cancel"), false, dialog);
  QPushButton *accept = createDialogButton(QDialog::tr("OK"), true, dialog);
  QObject::connect(reject, &QPushButton::clicked, dialog, &QDialog::reject);
  QObject::connect(accept, &QPushButton::clicked, dialog, &QDialog::accept);
  row->addWidget(reject);
  row->addWidget(accept);

  *outAccept = accept;
  *outReject = reject;
  return row;
}

void bindValidation(QLineEdit *edit, QLabel *errorLabel, QPushButton *acceptButton,
                    std::function<QString(const QString &)> validator) {
  if (!validator) {
    errorLabel->hide();
    return;
  }

  auto check = [edit, errorLabel, acceptButton, validator](const QString &text) {
    const QString message = validator(text);
    const bool valid = message.isEmpty();
    errorLabel->setText(message);
    errorLabel->setVisible(!valid);
    acceptButton->setEnabled(valid);
    if (edit->property("invalid").toBool() != !valid) {
      edit->setProperty("invalid", !valid);
      // Property selectors are only re-evaluated on repolish
      edit->style()->unpolish(edit);
      edit->style()->polish(edit);
    }
  };

  QObject::connect(edit, &QLineEdit::textChanged, edit, check);
  check(edit->text());
}

} // namespace McpIDE::editor::qt::detail
