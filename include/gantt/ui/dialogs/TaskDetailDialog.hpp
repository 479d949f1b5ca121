#pragma once

#include <QDialog>

#include "gantt/core/TaskForm.hpp"

class QLineEdit;
class QDateEdit;
class QPlainTextEdit;
class QComboBox;
class QSpinBox;
class QToolButton;

namespace gantt {
namespace ui {

class TaskDetailDialog : public QDialog
{
    Q_OBJECT

public:
    explicit TaskDetailDialog(QWidget *parent = nullptr);

    void setFormData(const core::TaskFormData &form);
    core::TaskFormData formData() const;

private:
    void updateColorSwatch();

    QLineEdit *m_nameEdit = nullptr;
    QDateEdit *m_startEdit = nullptr;
    QDateEdit *m_endEdit = nullptr;
    QSpinBox *m_progressSpin = nullptr;
    QLineEdit *m_colorEdit = nullptr;
    QToolButton *m_colorButton = nullptr;
    QComboBox *m_statusCombo = nullptr;
    QComboBox *m_priorityCombo = nullptr;
    QLineEdit *m_resourcesEdit = nullptr;
    QLineEdit *m_dependenciesEdit = nullptr;
    QPlainTextEdit *m_notesEdit = nullptr;
};

} // namespace ui
} // namespace gantt
