#include "McpIDE/editor/qt/mi_find_replace_dialog.hpp"
#include "McpIDE/editor/qt/mi_style_manager.hpp"

#include <QCheckBox>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QRadioButton>
#include <QRegularExpression>
#include <QVBoxLayout>

namespace McpIDE::editor::qt {

MIFindReplaceDialog::MIFindReplaceDialog(QWidget *parent) : QDialog(parent) {
  setWindowTitle(tr("Find and Replace"));
  setObjectName("MIFindReplaceDialog");
  setModal(false);
  setMinimumWidth(400);
  setWindowFlag(Qt::WindowContextHelpButtonHint, false);
  setupUi();
}

void MIFindReplaceDialog::setupUi() {
  const auto &spacing = MIStyleManager::instance().spacing();

  auto *mainLayout = new QVBoxLayout(this);
  mainLayout->setContentsMargins(spacing.lg, spacing.lg, spacing.lg, spacing.lg);
  mainLayout->setSpacing(spacing.md);

  auto *grid = new QGridLayout();
  m_searchEdit = new QLineEdit(this);
  m_searchEdit->setPlaceholderText(tr("Text to find"));
  m_replaceEdit = new QLineEdit(this);
  m_replaceEdit->setPlaceholderText(tr("Replacement text"));
  grid->addWidget(new QLabel(tr("Find:"), this), 0, 0);
  grid->addWidget(m_searchEdit, 0, 1);
  grid->addWidget(new QLabel(tr("Replace with:"), this), 1, 0);
  grid->addWidget(m_replaceEdit, 1, 1);

  auto *optionsGroup = new QGroupBox(tr("Options"), this);
  auto *optionsLayout = new QVBoxLayout(optionsGroup);
  m_caseSensitive = new QCheckBox(tr("Case sensitive"), optionsGroup);
  m_wholeWords = new QCheckBox(tr("Whole words only"), optionsGroup);
  m_regex = new QCheckBox(tr("Regular expression"), optionsGroup);
  optionsLayout->addWidget(m_caseSensitive);
  optionsLayout->addWidget(m_wholeWords);
  optionsLayout->addWidget(m_regex);

  auto *directionGroup = new QGroupBox(tr("Direction"), this);
  auto *directionLayout = new QVBoxLayout(directionGroup);
  m_forward = new QRadioButton(tr("Forward"), directionGroup);
  m_backward = new QRadioButton(tr("Backward"), directionGroup);
  m_forward->setChecked(true);
  directionLayout->addWidget(m_forward);
  directionLayout->addWidget(m_backward);

  auto *buttonsLayout = new QVBoxLayout();
  m_findButton = new QPushButton(tr("Find"), this);
  m_findButton->setDefault(true);
  m_replaceButton = new QPushButton(tr("Replace"), this);
  m_replaceAllButton = new QPushButton(tr("Replace All"), this);
  m_closeButton = new QPushButton(tr("Close"), this);
  buttonsLayout->addWidget(m_findButton);
  buttonsLayout->addWidget(m_replaceButton);
  buttonsLayout->addWidget(m_replaceAllButton);
  buttonsLayout->addWidget(m_closeButton);
  buttonsLayout->addStretch();

  auto *middleRow = new QHBoxLayout();
  middleRow->addWidget(optionsGroup);
  middleRow->addWidget(directionGroup);
  middleRow->addLayout(buttonsLayout);

  m_statusLabel = new QLabel(this);
  m_statusLabel->setObjectName("MIFindStatus");

  mainLayout->addLayout(grid);
  mainLayout->addLayout(middleRow);
  mainLayout->addWidget(m_statusLabel);

  connect(m_findButton, &QPushButton::clicked, this, &MIFindReplaceDialog::find);
  connect(m_replaceButton, &QPushButton::clicked, this, &MIFindReplaceDialog::replace);
  connect(m_replaceAllButton, &QPushButton::clicked, this, &MIFindReplaceDialog::replaceAll);
  connect(m_closeButton, &QPushButton::clicked, this, &QDialog::close);
  connect(m_searchEdit, &QLineEdit::returnPressed, this, &MIFindReplaceDialog::find);

  m_searchEdit->setFocus();
}

// ============================================================================
// State
// ============================================================================

void MIFindReplaceDialog::setSearchText(const QString &text) {
  m_searchEdit->setText(text);
  m_searchEdit->selectAll();
  m_searchEdit->setFocus();
}

QString MIFindReplaceDialog::searchText() const { return m_searchEdit->text(); }

void MIFindReplaceDialog::setReplaceText(const QString &text) { m_replaceEdit->setText(text); }

QString MIFindReplaceDialog::replaceText() const { return m_replaceEdit->text(); }

MISearchOptions MIFindReplaceDialog::options() const {
  MISearchOptions options;
  options.caseSensitive = m_caseSensitive->isChecked();
  options.wholeWords = m_wholeWords->isChecked();
  options.regex = m_regex->isChecked();
  options.forward = m_forward->isChecked();
  return options;
}

void MIFindReplaceDialog::setOptions(const MISearchOptions &options) {
  m_caseSensitive->setChecked(options.caseSensitive);
  m_wholeWords->setChecked(options.wholeWords);
  m_regex->setChecked(options.regex);
  m_forward->setChecked(options.forward);
  m_backward->setChecked(!options.forward);
}

void MIFindReplaceDialog::setStatusText(const QString &text) { m_statusLabel->setText(text); }

QString MIFindReplaceDialog::statusText() const { return m_statusLabel->text(); }

// ============================================================================
// Requests
// ============================================================================

bool MIFindReplaceDialog::validateInput() {
  const QString text = m_searchEdit->text();
  if (text.isEmpty()) {
    return false;
  }
  if (m_regex->isChecked() && !QRegularExpression(text).isValid()) {
    setStatusText(tr("Invalid regular expression"));
    return false;
  }
  return true;
}

void MIFindReplaceDialog::find() {
  if (!validateInput()) {
    return;
  }
  const MISearchOptions opts = options();
  if (opts.forward) {
    emit findNext(searchText(), opts.caseSensitive, opts.wholeWords, opts.regex);
  } else {
    emit findPrevious(searchText(), opts.caseSensitive, opts.wholeWords, opts.regex);
  }
}

void MIFindReplaceDialog::replace() {
  if (!validateInput()) {
    return;
  }
  const MISearchOptions opts = options();
  emit replaceRequested(searchText(), replaceText(), opts.caseSensitive, opts.wholeWords,
                        opts.regex);
}

void MIFindReplaceDialog::replaceAll() {
  if (!validateInput()) {
    return;
  }
  const MISearchOptions opts = options();
  emit replaceAllRequested(searchText(), replaceText(), opts.caseSensitive, opts.wholeWords,
                           opts.regex);
}

} // namespace McpIDE::editor::qt
