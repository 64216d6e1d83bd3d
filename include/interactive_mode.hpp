#pragma once

// Интерактивный режим: ввод функции и диапазона, построение точек,
// сводка по графику и, по желанию, сохранение точек в CSV
void runInteractiveMode();
