// SessionDialog.cpp
#include "SessionDialog.h"
#include "RemotePath.h"

#include <QDialogButtonBox>
#include <QDir>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QSpinBox>
#include <QToolButton>
#include <QVBoxLayout>

SessionDialog::SessionDialog(const SessionRecord& initial,
                             const QStringList& takenNames,
                             QWidget *parent)
    : QDialog(parent)
    , m_initial(initial)
    , m_taken(takenNames)
{
    setWindowTitle(initial.name.isEmpty() ? tr("New session") : tr("Edit session"));
    buildUi();
}

void SessionDialog::buildUi()
{
    auto *outer = new QVBoxLayout(this);
    outer->setContentsMargins(8, 8, 8, 8);

    auto *form = new QFormLayout();
    form->setLabelAlignment(Qt::AlignRight);
    form->setHorizontalSpacing(10);
    form->setVerticalSpacing(8);

    m_nameEdit = new QLineEdit(m_initial.name, this);
    m_hostEdit = new QLineEdit(m_initial.host, this);
    m_userEdit = new QLineEdit(m_initial.username, this);

    m_portSpin = new QSpinBox(this);
    m_portSpin->setRange(1, 65535);
    m_portSpin->setValue(m_initial.effectivePort());

    m_passwordEdit = new QLineEdit(m_initial.password, this);
    m_passwordEdit->setEchoMode(QLineEdit::Password);
    m_passwordEdit->setPlaceholderText(tr("optional"));

    m_keyFileEdit = new QLineEdit(m_initial.privateKeyPath, this);
    m_keyFileEdit->setPlaceholderText(tr("e.g. ~/.ssh/id_ed25519 (optional, wins over password)"));

    auto *browseBtn = new QToolButton(this);
    browseBtn->setText("...");

    auto *keyRow = new QWidget(this);
    auto *keyRowLayout = new QHBoxLayout(keyRow);
    keyRowLayout->setContentsMargins(0, 0, 0, 0);
    keyRowLayout->setSpacing(6);
    keyRowLayout->addWidget(m_keyFileEdit, 1);
    keyRowLayout->addWidget(browseBtn, 0);

    m_passphraseEdit = new QLineEdit(m_initial.privateKeyPassphrase, this);
    m_passphraseEdit->setEchoMode(QLineEdit::Password);
    m_passphraseEdit->setPlaceholderText(tr("optional"));

    m_remotePathEdit = new QLineEdit(m_initial.remotePath, this);

    form->addRow(tr("Name:"), m_nameEdit);
    form->addRow(tr("Host:"), m_hostEdit);
    form->addRow(tr("Port:"), m_portSpin);
    form->addRow(tr("Username:"), m_userEdit);
    form->addRow(tr("Password:"), m_passwordEdit);
    form->addRow(tr("Private key:"), keyRow);
    form->addRow(tr("Key passphrase:"), m_passphraseEdit);
    form->addRow(tr("Remote path:"), m_remotePathEdit);

    auto *hint = new QLabel(tr("Passwords are stored in the session file; prefer a key."), this);
    hint->setStyleSheet("color:#888;");

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);

    outer->addLayout(form);
    outer->addWidget(hint);
    outer->addWidget(buttons);

    connect(browseBtn, &QToolButton::clicked, this, &SessionDialog::browseKey);
    connect(buttons, &QDialogButtonBox::accepted, this, &SessionDialog::onAccepted);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);

    resize(520, sizeHint().height());
}

void SessionDialog::browseKey()
{
    const QString start = m_keyFileEdit->text().trimmed().isEmpty()
        ? QDir::homePath() + "/.ssh"
        : m_keyFileEdit->text().trimmed();

    const QString path = QFileDialog::getOpenFileName(this, tr("Select private key"), start);
    if (!path.isEmpty())
        m_keyFileEdit->setText(path);
}

SessionRecord SessionDialog::record() const
{
    SessionRecord r;
    r.host     = m_hostEdit->text().trimmed();
    r.username = m_userEdit->text().trimmed();
    r.port     = m_portSpin->value();
    r.name     = m_nameEdit->text().trimmed();
    if (r.name.isEmpty())
        r.name = r.target();

    r.password             = m_passwordEdit->text();
    r.privateKeyPath       = m_keyFileEdit->text().trimmed();
    r.privateKeyPassphrase = m_passphraseEdit->text();

    const QString rp = m_remotePathEdit->text().trimmed();
    r.remotePath = rp.isEmpty() ? QStringLiteral("/") : RemotePath::normalize(rp);
    return r;
}

bool SessionDialog::validate(QString* err) const
{
    const SessionRecord r = record();

    if (r.host.isEmpty()) {
        if (err) *err = tr("Host is required.");
        return false;
    }
    if (r.username.isEmpty()) {
        if (err) *err = tr("Username is required.");
        return false;
    }
    if (r.name != m_initial.name && m_taken.contains(r.name)) {
        if (err) *err = tr("A session named '%1' already exists.").arg(r.name);
        return false;
    }
    return true;
}

void SessionDialog::onAccepted()
{
    QString err;
    if (!validate(&err)) {
        QMessageBox::warning(this, tr("Invalid session"), err);
        return;
    }
    accept();
}
