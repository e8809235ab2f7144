#include "biostream/sample_csv.hpp"

#include "test_support.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace biostream;

static void write_file(const std::string& path, const std::string& text) {
  std::ofstream f(path);
  f << text;
}

static bool read_throws(const std::string& path) {
  try {
    (void)read_sample_csv(path);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

int main() {
  const std::string path = "test_sample_csv_tmp.csv";

  // Comma separated, leading time column dropped, comments skipped.
  {
    write_file(path,
               "# exported samples\n"
               "time_ms,TP9,AF7\n"
               "0,1.5,-2\n"
               "// gap\n"
               "\n"
               "4,2.5,1e1\n");
    const SampleTable t = read_sample_csv(path);
    assert(t.n_channels() == 2);
    assert(t.labels[0] == "TP9" && t.labels[1] == "AF7");
    assert(t.n_rows() == 2);
    assert(t.columns[0][1] == 2.5);
    assert(t.columns[1][1] == 10.0);
  }

  // Semicolon delimiter, quoted labels, no time column.
  {
    write_file(path,
               "\"AMBIENT\";\"IR\";\"RED\"\n"
               "1000;40000.5;20000\n");
    const SampleTable t = read_sample_csv(path);
    assert(t.n_channels() == 3);
    assert(t.labels[1] == "IR");
    assert(t.columns[1][0] == 40000.5);
  }

  // Tab delimiter.
  {
    write_file(path, "A\tB\n1\t2\n3\t4\n");
    const SampleTable t = read_sample_csv(path);
    assert(t.n_channels() == 2 && t.n_rows() == 2);
    assert(t.columns[1][1] == 4.0);
  }

  // Ragged row, bad number, header only with a time column.
  {
    write_file(path, "A,B\n1,2\n3\n");
    assert(read_throws(path));

    write_file(path, "A,B\n1,x2\n");
    assert(read_throws(path));

    write_file(path, "time\n0\n");
    assert(read_throws(path));

    write_file(path, "# only comments\n");
    assert(read_throws(path));
  }

  std::remove(path.c_str());
  assert(read_throws("missing_samples.csv"));

  std::cout << "test_sample_csv OK\n";
  return 0;
}
