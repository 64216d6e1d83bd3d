#pragma once

// Режим генерации: случайные определения функций в папку tests
// для последующей обработки в пакетном режиме
void runGenerateMode();
