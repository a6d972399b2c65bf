#include <iostream>

void run_history_benchmark();
void run_recovery_benchmark();

int main() {
  std::cout << "convlog Benchmarks\n";
  run_history_benchmark();
  run_recovery_benchmark();
  return 0;
}
