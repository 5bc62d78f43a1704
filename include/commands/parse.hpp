#pragma once

int cmd_parse(int argc, char** argv);
