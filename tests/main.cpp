#include <iostream>

int test_math();
int test_dynamic();
int test_rotating();
int test_body_tree();
int test_observatory();
int test_tree_file();
int test_artifexian();
int test_eclipse();
int test_program();

int main() {
  int fails = 0;

  fails += test_math();
  fails += test_dynamic();
  fails += test_rotating();
  fails += test_body_tree();
  fails += test_observatory();
  fails += test_tree_file();
  fails += test_artifexian();
  fails += test_eclipse();
  fails += test_program();

  if (fails == 0) {
    std::cout << "[orrery_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[orrery_tests] FAILS=" << fails << "\n";
  return 1;
}
