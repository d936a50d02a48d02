#include "McpIDE/editor/qt/mi_dialogs.hpp"
#include "McpIDE/editor/qt/mi_style_manager.hpp"
#include "mi_dialogs_detail.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>

namespace McpIDE::editor::qt {

namespace {

QString iconGlyph(MIMessageType type) {
  switch (type) {
  case MIMessageType::Info:
    return "i";
  case MIMessageType::Warning:
    return "!";
  case MIMessageType::Error:
    return "x";
  case MIMessageType::Question:
    return "?";
  }
  return QString();
}

QColor iconColor(MIMessageType type) {
  const auto &p = MIStyleManager::instance().palette();
  switch (type) {
  case MIMessageType::Info:
  case MIMessageType::Question:
    return p.info;
  case MIMessageType::Warning:
    return p.warning;
  case MIMessageType::Error:
    return p.error;
  }
  return p.foreground;
}

} // namespace

MIMessageDialog::MIMessageDialog(QWidget *parent, const QString &title, const QString &message,
                                 MIMessageType type, const QList<MIDialogButton> &buttons,
                                 MIDialogButton defaultButton)
    : QDialog(parent) {
  detail::prepareDialog(this, "MIMessageDialog", title);

  m_offersCancel = buttons.contains(MIDialogButton::Cancel);
  // Closing the window counts as Cancel when it is offered
  m_choice = m_offersCancel ? MIDialogButton::Cancel : MIDialogButton::None;

  buildUi(message, type, buttons, defaultButton);
  detail::animateDialogIn(this);
}

void MIMessageDialog::buildUi(const QString &message, MIMessageType type,
                              const QList<MIDialogButton> &buttons,
                              MIDialogButton defaultButton) {
  auto *layout = new QVBoxLayout(this);
  layout->setContentsMargins(detail::DIALOG_MARGIN, detail::DIALOG_MARGIN, detail::DIALOG_MARGIN,
                             detail::DIALOG_MARGIN);
  layout->setSpacing(detail::DIALOG_SPACING);

  auto *contentLayout = new QHBoxLayout();
  contentLayout->setSpacing(detail::DIALOG_SPACING);

  auto *icon = new QLabel(iconGlyph(type), this);
  icon->setObjectName("MIMessageIcon");
  icon->setAlignment(Qt::AlignCenter);
  icon->setFixedSize(32, 32);
  icon->setStyleSheet(QString("color: %1;").arg(
      MIStyleManager::colorToStyleString(iconColor(type))));
  contentLayout->addWidget(icon, 0, Qt::AlignTop);

  auto *text = new QLabel(message, this);
  text->setObjectName("MIMessageText");
  text->setWordWrap(true);
  text->setTextInteractionFlags(Qt::TextSelectableByMouse);
  contentLayout->addWidget(text, 1);

  layout->addLayout(contentLayout);

  auto *buttonLayout = new QHBoxLayout();
  buttonLayout->setContentsMargins(0, detail::DIALOG_SPACING, 0, 0);
  buttonLayout->setSpacing(8);
  buttonLayout->addStretch();

  const QList<MIDialogButton> effective =
      buttons.isEmpty() ? QList<MIDialogButton>{MIDialogButton::Ok} : buttons;

  for (MIDialogButton button : effective) {
    const bool isDefault = (button == defaultButton);
    QPushButton *pushButton = detail::createDialogButton(buttonText(button), isDefault, this);
    if (isDefault) {
      pushButton->setFocus();
    }

    connect(pushButton, &QPushButton::clicked, this, [this, button]() {
      m_choice = button;
      if (button == MIDialogButton::Cancel || button == MIDialogButton::No ||
          button == MIDialogButton::Close) {
        reject();
      } else {
        accept();
      }
    });
    buttonLayout->addWidget(pushButton);
  }

  layout->addLayout(buttonLayout);
}

QString MIMessageDialog::buttonText(MIDialogButton button) {
  switch (button) {
  case MIDialogButton::Ok:
    return tr("OK");
  case MIDialogButton::Cancel:
    return tr("Cancel");
  case MIDialogButton::Yes:
    return tr("Yes");
  case MIDialogButton::No:
    return tr("No");
  case MIDialogButton::Save:
    return tr("Save");
  case MIDialogButton::Discard:
    return tr("Don't Save");
  case MIDialogButton::Close:
    return tr("Close");
  case MIDialogButton::None:
    break;
  }
  return QString();
}

// ============================================================================
// Convenience API
// ============================================================================

MIDialogButton MIMessageDialog::showInfo(QWidget *parent, const QString &title,
                                         const QString &message) {
  MIMessageDialog dialog(parent, title, message, MIMessageType::Info, {MIDialogButton::Ok},
                         MIDialogButton::Ok);
  dialog.exec();
  return dialog.choice();
}

MIDialogButton MIMessageDialog::showWarning(QWidget *parent, const QString &title,
                                            const QString &message) {
  MIMessageDialog dialog(parent, title, message, MIMessageType::Warning, {MIDialogButton::Ok},
                         MIDialogButton::Ok);
  dialog.exec();
  return dialog.choice();
}

MIDialogButton MIMessageDialog::showError(QWidget *parent, const QString &title,
                                          const QString &message) {
  MIMessageDialog dialog(parent, title, message, MIMessageType::Error, {MIDialogButton::Ok},
                         MIDialogButton::Ok);
  dialog.exec();
  return dialog.choice();
}

MIDialogButton MIMessageDialog::showQuestion(QWidget *parent, const QString &title,
                                             const QString &message,
                                             const QList<MIDialogButton> &buttons,
                                             MIDialogButton defaultButton) {
  MIMessageDialog dialog(parent, title, message, MIMessageType::Question, buttons,
                         defaultButton);
  dialog.exec();
  return dialog.choice();
}

} // namespace McpIDE::editor::qt
