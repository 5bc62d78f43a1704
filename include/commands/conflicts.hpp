#pragma once

int cmd_conflicts(int argc, char** argv);
