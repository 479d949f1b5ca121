#include "gantt/ui/dialogs/TaskDetailDialog.hpp"

#include <QColorDialog>
#include <QComboBox>
#include <QDateEdit>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QSpinBox>
#include <QToolButton>
#include <QVBoxLayout>

#include "gantt/core/TaskFormatting.hpp"

namespace gantt {
namespace ui {

namespace {
const QString DateFormat = QStringLiteral("yyyy-MM-dd");

void selectByData(QComboBox *combo, const QString &value)
{
    const int index = combo->findData(value);
    if (index >= 0) {
        combo->setCurrentIndex(index);
    }
}
} // namespace

TaskDetailDialog::TaskDetailDialog(QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Edit Task"));
    auto *layout = new QVBoxLayout(this);
    auto *formLayout = new QFormLayout();

    m_nameEdit = new QLineEdit(this);
    formLayout->addRow(tr("Name"), m_nameEdit);

    m_startEdit = new QDateEdit(this);
    m_startEdit->setDisplayFormat(DateFormat);
    m_startEdit->setCalendarPopup(true);
    formLayout->addRow(tr("Start Date"), m_startEdit);

    m_endEdit = new QDateEdit(this);
    m_endEdit->setDisplayFormat(DateFormat);
    m_endEdit->setCalendarPopup(true);
    formLayout->addRow(tr("End Date"), m_endEdit);
    connect(m_startEdit, &QDateEdit::dateChanged, this, [this](const QDate &date) {
        m_endEdit->setMinimumDate(date);
    });

    m_progressSpin = new QSpinBox(this);
    m_progressSpin->setRange(0, 100);
    m_progressSpin->setSuffix(QStringLiteral("%"));
    formLayout->addRow(tr("Progress"), m_progressSpin);

    auto *colorRow = new QHBoxLayout();
    m_colorEdit = new QLineEdit(this);
    m_colorEdit->setPlaceholderText(QStringLiteral("#3b82f6"));
    m_colorButton = new QToolButton(this);
    colorRow->addWidget(m_colorEdit, 1);
    colorRow->addWidget(m_colorButton);
    formLayout->addRow(tr("Color"), colorRow);
    connect(m_colorEdit, &QLineEdit::textChanged, this, &TaskDetailDialog::updateColorSwatch);
    connect(m_colorButton, &QToolButton::clicked, this, [this]() {
        const QColor initial(m_colorEdit->text().trimmed());
        const QColor chosen = QColorDialog::getColor(initial.isValid() ? initial : QColor(QStringLiteral("#3b82f6")),
                                                     this,
                                                     tr("Task Color"));
        if (chosen.isValid()) {
            m_colorEdit->setText(chosen.name());
        }
    });

    m_statusCombo = new QComboBox(this);
    for (auto status : { data::TaskStatus::NotStarted,
                         data::TaskStatus::InProgress,
                         data::TaskStatus::Completed,
                         data::TaskStatus::OnHold }) {
        m_statusCombo->addItem(core::statusDisplayName(status), core::statusToString(status));
    }
    formLayout->addRow(tr("Status"), m_statusCombo);

    m_priorityCombo = new QComboBox(this);
    for (auto priority : { data::TaskPriority::Low, data::TaskPriority::Medium, data::TaskPriority::High }) {
        m_priorityCombo->addItem(core::priorityDisplayName(priority), core::priorityToString(priority));
    }
    formLayout->addRow(tr("Priority"), m_priorityCombo);

    m_resourcesEdit = new QLineEdit(this);
    m_resourcesEdit->setPlaceholderText(tr("Comma separated"));
    formLayout->addRow(tr("Resources"), m_resourcesEdit);

    m_dependenciesEdit = new QLineEdit(this);
    m_dependenciesEdit->setPlaceholderText(tr("Task ids, comma separated"));
    formLayout->addRow(tr("Dependencies"), m_dependenciesEdit);

    m_notesEdit = new QPlainTextEdit(this);
    formLayout->addRow(tr("Notes"), m_notesEdit);

    layout->addLayout(formLayout);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttonBox);

    setFormData(core::defaultFormData(QDate::currentDate()));
}

void TaskDetailDialog::setFormData(const core::TaskFormData &form)
{
    m_nameEdit->setText(form.name);
    const QDate start = core::parseTaskDate(form.startDate);
    const QDate end = core::parseTaskDate(form.endDate);
    m_startEdit->setDate(start.isValid() ? start : QDate::currentDate());
    m_endEdit->setDate(end.isValid() ? end : m_startEdit->date().addDays(1));
    m_progressSpin->setValue(form.progress);
    m_colorEdit->setText(form.color);
    selectByData(m_statusCombo, form.status);
    selectByData(m_priorityCombo, form.priority);
    m_resourcesEdit->setText(form.resources);
    m_dependenciesEdit->setText(form.dependencies);
    m_notesEdit->setPlainText(form.notes);
    updateColorSwatch();
}

core::TaskFormData TaskDetailDialog::formData() const
{
    core::TaskFormData form;
    form.name = m_nameEdit->text().trimmed();
    form.startDate = core::formatTaskDate(m_startEdit->date());
    form.endDate = core::formatTaskDate(m_endEdit->date());
    form.progress = m_progressSpin->value();
    form.color = m_colorEdit->text().trimmed();
    form.status = m_statusCombo->currentData().toString();
    form.priority = m_priorityCombo->currentData().toString();
    form.resources = m_resourcesEdit->text();
    form.dependencies = m_dependenciesEdit->text();
    form.notes = m_notesEdit->toPlainText();
    return form;
}

void TaskDetailDialog::updateColorSwatch()
{
    const QColor color(m_colorEdit->text().trimmed());
    const QString swatch = color.isValid() ? color.name() : QStringLiteral("transparent");
    m_colorButton->setStyleSheet(QStringLiteral("background-color: %1; border: 1px solid palette(mid);").arg(swatch));
}

} // namespace ui
} // namespace gantt
