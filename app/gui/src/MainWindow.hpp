#pragma once
#include <QMainWindow>
#include <QString>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QBarSeries>
#include <QtCharts/QBarSet>
#include <QtCharts/QBarCategoryAxis>
#include <QtCharts/QValueAxis>

#include <aw/session/session.hpp>
#include <aw/rebalance/rebalance.hpp>

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

class QLabel;
class QPushButton;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onBrowseCsv();
  void onCalculate();

  // Copie du montant d'un bouton de recommandation
  void onCopyBond();
  void onCopyIntl();
  void onCopyNatl();

private:
  Ui::MainWindow* ui;

  aw::session::Session session_;

  // Nom du fichier chargé (barre d'état)
  QLabel* fileLabel_{nullptr};

  void wireSignals();
  void applyStyle();

  void showStatus(const aw::session::Outcome& out);
  void showResult(const aw::rebalance::StrategyResult& res);
  void clearResult();
  void copyAmountOf(const QPushButton* btn);

  // ===== Allocation chart (courant vs cible) =====
  QtCharts::QChartView*       allocChartView_{nullptr};
  QtCharts::QChart*           allocChart_{nullptr};
  QtCharts::QBarSeries*       allocSeries_{nullptr};
  QtCharts::QBarSet*          currentSet_{nullptr};
  QtCharts::QBarSet*          targetSet_{nullptr};
  QtCharts::QBarCategoryAxis* allocAxisX_{nullptr};
  QtCharts::QValueAxis*       allocAxisY_{nullptr};

  QtCharts::QChartView* createChartInPlaceholder(QWidget* ph, QtCharts::QChart* chart);
  void setupAllocationChart();
  void resetAllocationChart();
  void updateAllocationChart(const aw::rebalance::StrategyResult& res);
};
