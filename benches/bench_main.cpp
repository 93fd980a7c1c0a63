#include <iostream>

void run_protocol_benchmark();
void run_store_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "tapbridge benchmarks\n";
  run_protocol_benchmark();
  run_store_benchmark();
  run_config_benchmark();
  return 0;
}
