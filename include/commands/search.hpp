#pragma once

int cmd_search(int argc, char** argv);
