#pragma once

#include <QDialog>
#include <QStringList>

#include "SessionRecord.h"

class QLineEdit;
class QSpinBox;

// Edit form for one SessionRecord. Names must be unique among
// `takenNames` (the edited record's own name is allowed).
class SessionDialog : public QDialog
{
    Q_OBJECT
public:
    SessionDialog(const SessionRecord& initial,
                  const QStringList& takenNames,
                  QWidget *parent = nullptr);

    SessionRecord record() const;

private slots:
    void onAccepted();
    void browseKey();

private:
    void buildUi();
    bool validate(QString* err) const;

    SessionRecord m_initial;
    QStringList   m_taken;

    QLineEdit *m_nameEdit = nullptr;
    QLineEdit *m_hostEdit = nullptr;
    QSpinBox  *m_portSpin = nullptr;
    QLineEdit *m_userEdit = nullptr;
    QLineEdit *m_passwordEdit = nullptr;
    QLineEdit *m_keyFileEdit = nullptr;
    QLineEdit *m_passphraseEdit = nullptr;
    QLineEdit *m_remotePathEdit = nullptr;
};
