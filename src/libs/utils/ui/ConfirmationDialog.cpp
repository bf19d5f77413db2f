// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/ui/ConfirmationDialog.hpp"

#include <QtWidgets/QDialogButtonBox>
#include <QtWidgets/QLabel>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QStyle>
#include <QtWidgets/QVBoxLayout>

namespace Utils {

ConfirmationDialog::ConfirmationDialog(QWidget* parent)
    : QDialog(parent)
{
    setObjectName(QStringLiteral("ConfirmationDialog"));
    setModal(true);
    setWindowFlag(Qt::WindowContextHelpButtonHint, false);

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(16, 16, 16, 16);
    layout->setSpacing(10);

    m_titleLabel = new QLabel(this);
    m_titleLabel->setObjectName(QStringLiteral("ConfirmationDialogTitle"));
    QFont titleFont = m_titleLabel->font();
    titleFont.setWeight(QFont::DemiBold);
    m_titleLabel->setFont(titleFont);
    m_titleLabel->setVisible(false);

    m_messageLabel = new QLabel(this);
    m_messageLabel->setObjectName(QStringLiteral("ConfirmationDialogMessage"));
    m_messageLabel->setWordWrap(true);
    m_messageLabel->setVisible(false);

    layout->addWidget(m_titleLabel);
    layout->addWidget(m_messageLabel);

    m_buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    m_confirmButton = m_buttons->button(QDialogButtonBox::Ok);
    m_cancelButton = m_buttons->button(QDialogButtonBox::Cancel);
    m_confirmButton->setObjectName(QStringLiteral("ConfirmationDialogConfirmButton"));
    m_cancelButton->setObjectName(QStringLiteral("ConfirmationDialogCancelButton"));

    connect(m_buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(m_buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);

    layout->addWidget(m_buttons);

    updateButtons();
}

bool ConfirmationDialog::confirm(QWidget* parent, const ConfirmationDialogConfig& config)
{
    ConfirmationDialog dialog(parent);
    dialog.setTitle(config.title);
    dialog.setMessage(config.message);
    dialog.setDestructive(config.destructive);
    dialog.setConfirmButtonText(config.confirmText);
    dialog.setCancelButtonText(config.cancelText);
    return dialog.exec() == QDialog::Accepted;
}

QString ConfirmationDialog::title() const
{
    return m_title;
}

void ConfirmationDialog::setTitle(const QString& title)
{
    const QString cleaned = title.trimmed();
    if (m_title == cleaned)
        return;
    m_title = cleaned;
    setWindowTitle(m_title);
    updateLabels();
    emit titleChanged(m_title);
}

QString ConfirmationDialog::message() const
{
    return m_message;
}

void ConfirmationDialog::setMessage(const QString& message)
{
    const QString cleaned = message.trimmed();
    if (m_message == cleaned)
        return;
    m_message = cleaned;
    updateLabels();
    emit messageChanged(m_message);
}

bool ConfirmationDialog::isDestructive() const
{
    return m_destructive;
}

void ConfirmationDialog::setDestructive(bool destructive)
{
    if (m_destructive == destructive)
        return;
    m_destructive = destructive;
    updateButtons();
    emit destructiveChanged(m_destructive);
}

void ConfirmationDialog::setConfirmButtonText(const QString& text)
{
    m_confirmText = text.trimmed();
    updateButtons();
}

void ConfirmationDialog::setCancelButtonText(const QString& text)
{
    m_cancelText = text.trimmed();
    updateButtons();
}

void ConfirmationDialog::updateLabels()
{
    m_titleLabel->setVisible(!m_title.isEmpty());
    m_titleLabel->setText(m_title);

    m_messageLabel->setVisible(!m_message.isEmpty());
    m_messageLabel->setText(m_message);
}

void ConfirmationDialog::updateButtons()
{
    if (!m_confirmText.isEmpty())
        m_confirmButton->setText(m_confirmText);
    m_confirmButton->setDefault(true);
    m_confirmButton->setAutoDefault(true);

    if (!m_cancelText.isEmpty())
        m_cancelButton->setText(m_cancelText);

    // Stylesheets key on the property, so re-polish after it changes.
    m_confirmButton->setProperty("destructive", m_destructive);
    if (QStyle* style = m_confirmButton->style()) {
        style->unpolish(m_confirmButton);
        style->polish(m_confirmButton);
        m_confirmButton->update();
    }
}

} // namespace Utils
