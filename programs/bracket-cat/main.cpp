#include "cat.hpp"

#include <iostream>

int main(int argc, char* argv[])
{
   return bracket::cat::run(argc, argv, std::cerr);
}
