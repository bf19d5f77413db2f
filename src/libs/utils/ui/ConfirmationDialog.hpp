// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QString>
#include <QtWidgets/QDialog>

QT_BEGIN_NAMESPACE
class QDialogButtonBox;
class QLabel;
class QPushButton;
QT_END_NAMESPACE

namespace Utils {

struct UTILS_EXPORT ConfirmationDialogConfig final {
    QString title;
    QString message;
    QString confirmText;
    QString cancelText;
    bool destructive = false;
};

class UTILS_EXPORT ConfirmationDialog final : public QDialog
{
    Q_OBJECT
    Q_PROPERTY(QString title READ title WRITE setTitle NOTIFY titleChanged)
    Q_PROPERTY(QString message READ message WRITE setMessage NOTIFY messageChanged)
    Q_PROPERTY(bool destructive READ isDestructive WRITE setDestructive NOTIFY destructiveChanged)

public:
    explicit ConfirmationDialog(QWidget* parent = nullptr);

    // Modal; true when the user confirmed.
    static bool confirm(QWidget* parent, const ConfirmationDialogConfig& config);

    QString title() const;
    void setTitle(const QString& title);

    QString message() const;
    void setMessage(const QString& message);

    bool isDestructive() const;
    void setDestructive(bool destructive);

    void setConfirmButtonText(const QString& text);
    void setCancelButtonText(const QString& text);

    QPushButton* confirmButton() const { return m_confirmButton; }
    QPushButton* cancelButton() const { return m_cancelButton; }

signals:
    void titleChanged(const QString& title);
    void messageChanged(const QString& message);
    void destructiveChanged(bool destructive);

private:
    void updateLabels();
    void updateButtons();

    QString m_title;
    QString m_message;
    QString m_confirmText;
    QString m_cancelText;
    bool m_destructive = false;

    QLabel* m_titleLabel = nullptr;
    QLabel* m_messageLabel = nullptr;
    QDialogButtonBox* m_buttons = nullptr;
    QPushButton* m_confirmButton = nullptr;
    QPushButton* m_cancelButton = nullptr;
};

} // namespace Utils
