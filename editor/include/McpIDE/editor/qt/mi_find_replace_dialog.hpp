#pragma once

/**
 * @file mi_find_replace_dialog.hpp
 * @brief Non-modal find and replace dialog
 *
 * The dialog only collects input and emits requests; the owner runs the
 * search on the current editor and reports back through setStatusText().
 */

#include <QDialog>
#include <QString>

class QCheckBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QRadioButton;

namespace McpIDE::editor::qt {

struct MISearchOptions {
  bool caseSensitive = false;
  bool wholeWords = false;
  bool regex = false;
  bool forward = true;
};

class MIFindReplaceDialog final : public QDialog {
  Q_OBJECT

public:
  explicit MIFindReplaceDialog(QWidget *parent = nullptr);
  ~MIFindReplaceDialog() override = default;

  /**
   * @brief Prefill the find text and select it
   */
  void setSearchText(const QString &text);
  [[nodiscard]] QString searchText() const;

  void setReplaceText(const QString &text);
  [[nodiscard]] QString replaceText() const;

  [[nodiscard]] MISearchOptions options() const;
  void setOptions(const MISearchOptions &options);

  void setStatusText(const QString &text);
  [[nodiscard]] QString statusText() const;

public slots:
  void find();
  void replace();
  void replaceAll();

signals:
  void findNext(const QString &text, bool caseSensitive, bool wholeWords, bool regex);
  void findPrevious(const QString &text, bool caseSensitive, bool wholeWords, bool regex);
  void replaceRequested(const QString &find, const QString &replacement, bool caseSensitive,
                        bool wholeWords, bool regex);
  void replaceAllRequested(const QString &find, const QString &replacement, bool caseSensitive,
                           bool wholeWords, bool regex);

private:
  void setupUi();

  /**
   * @brief Check the find text before any request is emitted
   * @return false when the text is empty or an invalid regex
   */
  bool validateInput();

  QLineEdit *m_searchEdit = nullptr;
  QLineEdit *m_replaceEdit = nullptr;
  QCheckBox *m_caseSensitive = nullptr;
  QCheckBox *m_wholeWords = nullptr;
  QCheckBox *m_regex = nullptr;
  QRadioButton *m_forward = nullptr;
  QRadioButton *m_backward = nullptr;
  QPushButton *m_findButton = nullptr;
  QPushButton *m_replaceButton = nullptr;
  QPushButton *m_replaceAllButton = nullptr;
  QPushButton *m_closeButton = nullptr;
  QLabel *m_statusLabel = nullptr;
};

} // namespace McpIDE::editor::qt
