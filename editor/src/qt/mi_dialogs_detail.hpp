#pragma once

/**
 * @file mi_dialogs_detail.hpp
 * @brief Layout constants and theme helpers shared by the modal dialogs
 */

#include <QString>
#include <functional>

class QDialog;
class QHBoxLayout;
class QLabel;
class QLineEdit;
class QPushButton;
class QWidget;

namespace McpIDE::editor::qt::detail {

constexpr int DIALOG_MIN_WIDTH = 380;
constexpr int DIALOG_BUTTON_MIN_WIDTH = 80;
constexpr int DIALOG_BUTTON_HEIGHT = 28;
constexpr int DIALOG_MARGIN = 16;
constexpr int DIALOG_SPACING = 10;

/// Window flags, minimum width and the themed stylesheet
void prepareDialog(QDialog *dialog, const QString &objectName, const QString &title);

/// Fade in on first show; skipped for dialogs that never become visible
void animateDialogIn(QDialog *dialog);

QPushButton *createDialogButton(const QString &text, bool primary, QWidget *parent);

/**
 * @brief Right-aligned Cancel/OK row; OK is the default button
 */
QHBoxLayout *createAcceptRejectRow(QDialog *dialog, QPushButton **outAccept,
                                   QPushButton **outReject);

/**
 * @brief Re-run @p validator whenever @p edit changes
 *
 * The message goes to @p errorLabel, the field gets the `invalid` dynamic
 * property for the stylesheet and @p acceptButton is disabled while the
 * text is rejected.
 */
void bindValidation(QLineEdit *edit, QLabel *errorLabel, QPushButton *acceptButton,
                    std::function<QString(const QString &)> validator);

} // namespace McpIDE::editor::qt::detail
