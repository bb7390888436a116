#include <QApplication>
#include <QClipboard>

#include <clocale>

#include "MainWindow.hpp"

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  // QApplication applique la locale système : les montants restent en notation "C"
  std::setlocale(LC_NUMERIC, "C");
  QApplication::setApplicationName("AllocWorkbench");

  QApplication::clipboard()->clear(QClipboard::Clipboard);

  MainWindow w;
  w.show();
  return app.exec();
}
