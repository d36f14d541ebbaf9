/**
 * @file test_text_utils.cpp
 * @brief Юнит-тесты перекодировки CP1251
 */

#include <doctest/doctest.h>
#include "io/text_utils.hpp"

using namespace petrolog::io;

TEST_CASE("Проверка UTF-8") {
    CHECK(isValidUtf8("SAMPLE-1"));
    CHECK(isValidUtf8("Скв-1"));
    CHECK(isValidUtf8(""));

    CHECK_FALSE(isValidUtf8("\xD1\xEA\xE2-1"));   // CP1251
    CHECK_FALSE(isValidUtf8("\xC0\xAF"));          // избыточная запись '/'
    CHECK_FALSE(isValidUtf8("\xED\xA0\x80"));      // суррогат
    CHECK_FALSE(isValidUtf8("\xD0"));              // обрыв последовательности
}

TEST_CASE("CP1251 -> UTF-8") {
    CHECK(convertCp1251ToUtf8("\xD1\xEA\xE2-1") == "Скв-1");
    CHECK(convertCp1251ToUtf8("\xC0\xFF") == "Ая");
    CHECK(convertCp1251ToUtf8("\xA8\xB8") == "Ёё");
    CHECK(convertCp1251ToUtf8("\xB9") == "№");
    CHECK(convertCp1251ToUtf8("\x98") == "?");
    CHECK(convertCp1251ToUtf8("GR.GAPI") == "GR.GAPI");
}

TEST_CASE("ensureUtf8 не трогает корректный UTF-8") {
    CHECK(ensureUtf8("Месторождение")
          == "Месторождение");
    CHECK(ensureUtf8("\xCC\xE5\xF1\xF2\xEE\xF0\xEE\xE6\xE4\xE5\xED\xE8\xE5")
          == "Месторождение");
}
