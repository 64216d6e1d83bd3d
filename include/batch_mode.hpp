#pragma once

// Пакетный режим: файл с функциями (по одной на строку) -> CSV с точками.
// Функции строятся параллельно в пуле потоков, результаты пишутся
// в порядке строк входного файла.
void runBatchMode();
