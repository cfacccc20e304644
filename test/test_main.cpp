#include <iostream>

void test_text();
void test_strings();
void test_numbers();
void test_structure();
void test_dynamic();
void test_records();
void test_errors();
void test_threads();
void test_random();

int main() {
  test_text();
  test_strings();
  test_numbers();
  test_structure();
  test_dynamic();
  test_records();
  test_errors();
  test_threads();
  test_random();

  std::cout << "tinyjson tests passed\n";
  return 0;
}
