#include "run_tool.hpp"

#include <iostream>

int main(int argc, char* argv[])
{
   std::ios_base::sync_with_stdio(false);

   return run_tool(argc, argv);
}
