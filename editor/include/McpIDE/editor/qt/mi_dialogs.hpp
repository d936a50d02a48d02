#pragma once

/**
 * @file mi_dialogs.hpp
 * @brief Styled modal dialogs shared by the editor widgets
 */

#include <QDialog>
#include <QLineEdit>
#include <QList>
#include <QString>
#include <functional>

class QLabel;
class QPushButton;

namespace McpIDE::editor::qt {

enum class MIDialogButton { None, Ok, Cancel, Yes, No, Save, Discard, Close };

enum class MIMessageType { Info, Warning, Error, Question };

/**
 * @brief Message box with themed styling and an explicit button choice
 */
class MIMessageDialog final : public QDialog {
  Q_OBJECT

public:
  MIMessageDialog(QWidget *parent, const QString &title, const QString &message,
                  MIMessageType type, const QList<MIDialogButton> &buttons,
                  MIDialogButton defaultButton = MIDialogButton::Ok);

  /**
   * @brief Button that closed the dialog
   *
   * Closing the window without a button yields Cancel when Cancel is offered,
   * otherwise None.
   */
  [[nodiscard]] MIDialogButton choice() const { return m_choice; }

  static MIDialogButton showInfo(QWidget *parent, const QString &title, const QString &message);
  static MIDialogButton showWarning(QWidget *parent, const QString &title,
                                    const QString &message);
  static MIDialogButton showError(QWidget *parent, const QString &title, const QString &message);
  static MIDialogButton showQuestion(QWidget *parent, const QString &title,
                                     const QString &message,
                                     const QList<MIDialogButton> &buttons,
                                     MIDialogButton defaultButton);

  static QString buttonText(MIDialogButton button);

private:
  void buildUi(const QString &message, MIMessageType type, const QList<MIDialogButton> &buttons,
               MIDialogButton defaultButton);

  MIDialogButton m_choice = MIDialogButton::None;
  bool m_offersCancel = false;
};

/**
 * @brief Single line text prompt with optional live validation
 */
class MIInputDialog final : public QDialog {
  Q_OBJECT

public:
  /// Returns an error message for invalid input, empty when valid
  using Validator = std::function<QString(const QString &)>;

  static QString getText(QWidget *parent, const QString &title, const QString &label,
                         const QString &text = QString(), bool *ok = nullptr,
                         Validator validator = nullptr);

private:
  MIInputDialog(QWidget *parent, const QString &title, const QString &label, const QString &text,
                Validator validator);

  QLineEdit *m_textEdit = nullptr;
  QLabel *m_errorLabel = nullptr;
  QPushButton *m_okButton = nullptr;
  QPushButton *m_cancelButton = nullptr;
};

/**
 * @brief File pickers backed by QFileDialog
 */
class MIFileDialog final {
public:
  MIFileDialog() = delete;

  static QString getOpenFileName(QWidget *parent, const QString &title,
                                 const QString &dir = QString(),
                                 const QString &filter = QString());
  static QString getSaveFileName(QWidget *parent, const QString &title,
                                 const QString &dir = QString(),
                                 const QString &filter = QString());
  static QString getExistingDirectory(QWidget *parent, const QString &title,
                                      const QString &dir = QString());

  static QString defaultFilter();
};

} // namespace McpIDE::editor::qt
