#include "job.hpp"


static void startup() {
    std::cerr << "--------------------------------------------------\n";
    std::cerr << "SymInt: symbolic integration engine loaded\n";
    std::cerr << "--------------------------------------------------\n";
}


int main(int argc, const char** argv) {
    if (argc != 2)
        integration_job::usage();

    startup();
    auto job = integration_job::from_file(argv[1]);
    job.run(std::cout);
}
