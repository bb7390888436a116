#include "MainWindow.hpp"
#include "ui_MainWindow.h"

#include <QClipboard>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFontDatabase>
#include <QGuiApplication>
#include <QLabel>
#include <QPainter>
#include <QPushButton>
#include <QStatusBar>
#include <QVBoxLayout>

#include <aw/report/report.hpp>

namespace {
const char* kButtonStyle = "background-color: #3F3F3F; color: #ffffff";
const char* kWindowStyle = "background-color: #4a4a4a; color: #ffffff";

const QColor C_CURRENT(33,150,243);   // allocation courante (bleu)
const QColor C_TARGET (255,193,7);    // allocation cible (ambre)
}

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent), ui(new Ui::MainWindow) {
  ui->setupUi(this);
  applyStyle();
  wireSignals();

  fileLabel_ = new QLabel(this);
  fileLabel_->setObjectName("lblFileName");
  fileLabel_->setText("No file");
  statusBar()->addPermanentWidget(fileLabel_, /*stretch*/1);

  setupAllocationChart();
  clearResult();
}

MainWindow::~MainWindow() {
  // la vue possède son QChart
  delete allocChartView_; allocChartView_ = nullptr;
  delete ui;
}

void MainWindow::applyStyle() {
  setStyleSheet(kWindowStyle);
  for (QPushButton* b : {ui->btnBrowseCsv, ui->btnCalculate, ui->btnBond, ui->btnIntl, ui->btnNatl})
    b->setStyleSheet(kButtonStyle);

  // le tableau est aligné sur des colonnes fixes
  QFont mono = QFontDatabase::systemFont(QFontDatabase::FixedFont);
  mono.setPointSize(10);
  ui->lblReport->setFont(mono);
}

void MainWindow::wireSignals() {
  connect(ui->btnBrowseCsv, &QPushButton::clicked, this, &MainWindow::onBrowseCsv);
  connect(ui->btnCalculate, &QPushButton::clicked, this, &MainWindow::onCalculate);
  connect(ui->editAmount,   &QLineEdit::returnPressed, this, &MainWindow::onCalculate);

  connect(ui->btnBond, &QPushButton::clicked, this, &MainWindow::onCopyBond);
  connect(ui->btnIntl, &QPushButton::clicked, this, &MainWindow::onCopyIntl);
  connect(ui->btnNatl, &QPushButton::clicked, this, &MainWindow::onCopyNatl);
}

void MainWindow::onBrowseCsv() {
  const QString path = QFileDialog::getOpenFileName(
      this, tr("Open file"), QDir::homePath(), tr("csv files (*.csv)"));
  // dialogue annulé : chemin vide, la séance repasse à "aucune donnée"

  const auto out = session_.load(path.toStdString());
  qDebug() << "[UI] load" << path << "->" << (out.ok() ? QString("ok") : QString::fromStdString(out.detail));
  for (const auto& w : session_.warnings())
    qWarning() << "[Session]" << QString::fromStdString(w);

  clearResult();
  if (!out.ok()) {
    fileLabel_->setText("No file");
    showStatus(out);
    return;
  }
  fileLabel_->setText(QDir::toNativeSeparators(path));
  ui->lblStatus->setText(path);

  const auto& glide = aw::allocation::select_glide_path(session_.loaded_file_name());
  statusBar()->showMessage(QString::fromStdString(aw::report::describe_glide_path(glide)), 4000);
}

void MainWindow::onCalculate() {
  const auto out = session_.calculate(ui->editAmount->text().toStdString());
  showStatus(out);
  if (!out.ok()) {
    qDebug() << "[UI] calculate failed:" << QString::fromStdString(out.detail);
    return;
  }
  showResult(*session_.last_result());
}

void MainWindow::showStatus(const aw::session::Outcome& out) {
  ui->lblStatus->setText(QString::fromStdString(out.message));
}

void MainWindow::showResult(const aw::rebalance::StrategyResult& res) {
  QPushButton* buttons[] = {ui->btnBond, ui->btnIntl, ui->btnNatl};
  for (std::size_t i = 0; i < res.funds.size(); ++i) {
    buttons[i]->setText(QString::fromStdString(aw::report::format_recommendation(res.funds[i])));
  }
  ui->lblReport->setText(QString::fromStdString(aw::report::render_report(res)));
  updateAllocationChart(res);

  qDebug() << "[UI] strategy:" << res.glide_path.token
           << "total=" << res.total << "new=" << res.new_money;
}

void MainWindow::clearResult() {
  ui->btnBond->setText(QString());
  ui->btnIntl->setText(QString());
  ui->btnNatl->setText(QString());
  ui->lblReport->setText(QString());
  resetAllocationChart();
}

void MainWindow::copyAmountOf(const QPushButton* btn) {
  const QString amount = QString::fromStdString(aw::report::extract_amount(btn->text().toStdString()));
  QGuiApplication::clipboard()->setText(amount, QClipboard::Clipboard);
  if (!amount.isEmpty())
    statusBar()->showMessage(tr("%1 copied to clipboard").arg(amount), 2000);
}

void MainWindow::onCopyBond() { copyAmountOf(ui->btnBond); }
void MainWindow::onCopyIntl() { copyAmountOf(ui->btnIntl); }
void MainWindow::onCopyNatl() { copyAmountOf(ui->btnNatl); }

QtCharts::QChartView* MainWindow::createChartInPlaceholder(QWidget* ph, QtCharts::QChart* chart)
{
  using namespace QtCharts;
  auto* view = new QChartView(chart, ph);
  view->setRenderHint(QPainter::Antialiasing);
  view->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
  auto* lay = new QVBoxLayout(ph);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(view);
  return view;
}

void MainWindow::setupAllocationChart() {
  if (allocChartView_) return;
  if (!ui->chartPlaceholder) return;

  using namespace QtCharts;

  allocChart_ = new QChart();
  allocChart_->setTitle("Allocation");
  allocChart_->legend()->setVisible(true);
  allocChart_->legend()->setAlignment(Qt::AlignBottom);

  QStringList cats = {"Bond", "International", "National"};
  allocAxisX_ = new QBarCategoryAxis(allocChart_); allocAxisX_->append(cats);
  allocAxisY_ = new QValueAxis(allocChart_);
  allocAxisY_->setRange(0.0, 100.0);
  allocAxisY_->setLabelFormat("%.0f%%");

  allocSeries_ = new QBarSeries(allocChart_);
  currentSet_  = new QBarSet("Current", allocSeries_);
  targetSet_   = new QBarSet("Target",  allocSeries_);
  currentSet_->setColor(C_CURRENT);
  targetSet_->setColor(C_TARGET);
  currentSet_->setBorderColor(Qt::transparent);
  targetSet_->setBorderColor(Qt::transparent);
  allocSeries_->append(currentSet_);
  allocSeries_->append(targetSet_);
  allocSeries_->setBarWidth(0.7);

  allocChart_->addSeries(allocSeries_);
  allocChart_->addAxis(allocAxisX_, Qt::AlignBottom);
  allocChart_->addAxis(allocAxisY_, Qt::AlignLeft);
  allocSeries_->attachAxis(allocAxisX_);
  allocSeries_->attachAxis(allocAxisY_);

  allocChartView_ = createChartInPlaceholder(ui->chartPlaceholder, allocChart_);
}

void MainWindow::resetAllocationChart() {
  if (!currentSet_ || !targetSet_) return;
  if (currentSet_->count() > 0) currentSet_->remove(0, currentSet_->count());
  if (targetSet_->count()  > 0) targetSet_->remove(0, targetSet_->count());
  *currentSet_ << 0.0 << 0.0 << 0.0;
  *targetSet_  << 0.0 << 0.0 << 0.0;
}

void MainWindow::updateAllocationChart(const aw::rebalance::StrategyResult& res) {
  if (!currentSet_ || !targetSet_) {
    qWarning() << "Allocation chart not initialized: missing bar sets";
    return;
  }
  currentSet_->remove(0, currentSet_->count());
  targetSet_->remove(0, targetSet_->count());
  for (const auto& f : res.funds) {
    const double cur = res.invested_total != 0.0 ? f.current / res.invested_total : 0.0;
    *currentSet_ << 100.0 * cur;
    *targetSet_  << 100.0 * f.target_pct;
  }
}
